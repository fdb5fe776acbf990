/* MIT License
 *
 * Copyright (c) 2024 Andrew D Smith
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include "command_probe.hpp"

static constexpr auto about = R"(
print the response headers for a url
)";

static constexpr auto description = R"(
Request only the headers for a url and print them as received. This checks
that a file is available, and shows its size and type, without downloading
it. Transport options and settings are the same as for 'fetch'.
)";

static constexpr auto examples = R"(
Examples:

curlew probe -u https://example.com/box.img

curlew probe -u https://example.com/box.img --cacert ca.pem
)";

#include "cli_common.hpp"
#include "environment_utilities.hpp"
#include "interrupt_watcher.hpp"
#include "logger.hpp"
#include "transfer_coordinator.hpp"
#include "transfer_request.hpp"
#include "transfer_settings.hpp"
#include "transport_config.hpp"
#include "utilities.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <format>
#include <iostream>
#include <print>
#include <string>
#include <system_error>
#include <utility>  // for std::unreachable

auto
command_probe_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto log_level_default = curlew::log_level_t::info;
  static constexpr auto command = "probe";
  static const auto usage =
    std::format("Usage: curlew {} [options]", rstrip(command));
  static const auto about_msg =
    std::format("curlew {}: {}", rstrip(command), rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  namespace cu = curlew;

  std::string source;
  std::string config_file;
  std::string tool;
  cu::transport_config config;
  cu::log_level_t log_level{log_level_default};

  CLI::App app{about_msg};
  argv = app.ensure_utf8(argv);
  app.usage(usage);
  if (argc >= 2)
    app.footer(description_msg);
  app.formatter(std::make_shared<curlew_formatter>());
  app.get_formatter()->column_width(column_width_default);
  app.get_formatter()->label("REQUIRED", "REQD");
  app.set_help_flag("-h,--help", "Print a detailed help message and exit");
  // clang-format off
  app.add_option("-u,--url", source, "url to request headers for")
    ->required();
  add_transport_options(app, config);
  app.add_option("--tool", tool, "transfer tool to run (default: curl)");
  app.add_option("-c,--config-file", config_file,
                 "settings file; see help for default")
    ->option_text("FILE")
    ->check(CLI::ExistingFile);
  const auto log_level_opt =
    app.add_option("-v,--log-level", log_level,
                   "{debug, info, warning, error, critical}")
    ->option_text(std::format("ENUM [{}]", log_level_default))
    ->transform(CLI::CheckedTransformer(cu::log_level_cli11, CLI::ignore_case));
  // clang-format on

  if (argc < 2) {
    std::println("{}", app.help());
    return EXIT_SUCCESS;
  }
  CLI11_PARSE(app, argc, argv);

  // the headers go to stdout, so logging goes to stderr
  auto &lgr = cu::logger::instance(cu::shared_from_cerr(), command, log_level);
  if (!lgr) {
    std::println(std::cerr, "Failure initializing logging: {}.",
                 lgr.get_status());
    return EXIT_FAILURE;
  }

  std::error_code error;
  auto settings = load_settings(config_file, error);
  if (error) {
    lgr.error("Error reading settings: {}", error);
    return EXIT_FAILURE;
  }
  if (log_level_opt->count() == 0)
    cu::logger::set_level(settings.log_level);
  if (!tool.empty())
    settings.tool = tool;
  settings.apply_to(config);
  config.installer_embedded_dir = cu::get_installer_embedded_dir();

  const cu::transfer_request req(source, config);

  const cu::interrupt_watcher watcher;
  cu::transfer_coordinator coordinator(settings.tool);
  const auto [headers, outcome] =
    coordinator.probe_headers(req, watcher.get_token(), error);
  if (error)
    return EXIT_FAILURE;

  switch (outcome.status) {
  case cu::outcome_status_t::success:
    std::print("{}", headers);
    return EXIT_SUCCESS;
  case cu::outcome_status_t::cancelled:
    lgr.warning("Request cancelled: {}", req.source);
    return exit_cancelled;
  case cu::outcome_status_t::tool_error:
    lgr.error("Request failed: {}",
              outcome.message.empty() ? "no reason given" : outcome.message);
    return EXIT_FAILURE;
  }
  std::unreachable();
}
