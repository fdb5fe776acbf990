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

#include "command_config.hpp"

static constexpr auto about = R"(
write a curlew settings file
)";

static constexpr auto description = R"(
Write the settings used by the 'fetch' and 'probe' commands for any value not
given on their command lines. The default settings file is
'${HOME}/.config/curlew/curlew.conf'. With '--update', values already in the
settings file are kept unless given here. Paths to certificates are written
as absolute paths.
)";

static constexpr auto examples = R"(
Examples:

curlew config --cacert /etc/ssl/certs/ca-certificates.crt

curlew config --tool /usr/local/bin/curl -v debug

curlew config --update --insecure -c curlew.conf
)";

#include "cli_common.hpp"
#include "environment_utilities.hpp"
#include "logger.hpp"
#include "transfer_settings.hpp"
#include "utilities.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <print>
#include <string>
#include <system_error>
#include <tuple>
#include <vector>

auto
command_config_main(int argc, char *argv[]) -> int {  // NOLINT(*-c-arrays)
  static constexpr auto command = "config";
  static const auto usage =
    std::format("Usage: curlew {} [options]", rstrip(command));
  static const auto about_msg =
    std::format("curlew {}: {}", rstrip(command), rstrip(about));
  static const auto description_msg =
    std::format("{}\n{}", rstrip(description), rstrip(examples));

  namespace cu = curlew;

  cu::transfer_settings settings;
  std::string config_file;
  bool update_config{false};
  bool quiet{false};

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
  app.add_option("-c,--config-file", config_file,
                 "settings file to write; see help for default")
    ->option_text("FILE");
  app.add_option("--tool", settings.tool, "transfer tool to run")
    ->option_text(std::format("TEXT [{}]", cu::transfer_settings::tool_default));
  app.add_option("--cacert", settings.ca_cert, "CA certificate file");
  app.add_option("--capath", settings.ca_path, "directory of CA certificates");
  app.add_option("--cert", settings.client_cert, "client certificate file");
  app.add_flag("--insecure", settings.insecure,
               "do not verify server certificates")
    ->option_text(" ");
  app.add_flag("--installer-mode", settings.installer_mode,
               "use the CA bundle in the installer embedded directory")
    ->option_text(" ");
  app.add_option("-v,--log-level", settings.log_level,
                 "{debug, info, warning, error, critical}")
    ->option_text(std::format("ENUM [{}]", settings.log_level))
    ->transform(CLI::CheckedTransformer(cu::log_level_cli11, CLI::ignore_case));
  app.add_flag("--update", update_config, "keep values previously configured")
    ->option_text(" ");
  app.add_flag("-q,--quiet", quiet, "only report errors")
    ->option_text(" ");
  // clang-format on

  if (argc < 2) {
    std::println("{}", app.help());
    return EXIT_SUCCESS;
  }
  CLI11_PARSE(app, argc, argv);

  auto &lgr = cu::logger::instance(
    cu::shared_from_cerr(), command,
    quiet ? cu::log_level_t::error : cu::log_level_t::info);
  if (!lgr) {
    std::println(std::cerr, "Failure initializing logging: {}.",
                 lgr.get_status());
    return EXIT_FAILURE;
  }

  std::error_code error;
  if (config_file.empty()) {
    config_file = cu::get_default_config_file(error);
    if (error) {
      lgr.error("Error obtaining settings file name: {}", error);
      return EXIT_FAILURE;
    }
    lgr.debug("Taking default settings file: {}", config_file);
  }

  if (update_config) {
    const bool file_exists = std::filesystem::exists(config_file, error);
    if (error) {
      lgr.error("Error checking for settings file {}: {}", config_file, error);
      return EXIT_FAILURE;
    }
    if (file_exists) {
      lgr.debug("Loading unspecified values from: {}", config_file);
      settings.read_config_file_no_overwrite(config_file, error);
      if (error) {
        lgr.error("Error reading settings file {}: {}", config_file, error);
        return EXIT_FAILURE;
      }
    }
  }
  settings.make_paths_absolute();

  using std::string_literals::operator""s;
  constexpr auto or_none = [](const auto &s) {
    return s.empty() ? "none specified"s : s;
  };
  const std::vector<std::tuple<std::string, std::string>> args_to_log{
    // clang-format off
    {"Settings file", config_file},
    {"Tool", settings.tool},
    {"CA cert", or_none(settings.ca_cert)},
    {"CA path", or_none(settings.ca_path)},
    {"Client cert", or_none(settings.client_cert)},
    {"Insecure", std::format("{}", settings.insecure)},
    {"Installer mode", std::format("{}", settings.installer_mode)},
    {"Log level", std::format("{}", settings.log_level)},
    // clang-format on
  };
  cu::log_args<cu::log_level_t::info>(args_to_log);

  error = settings.write(config_file);
  if (error) {
    lgr.error("Error writing settings file {}: {}", config_file, error);
    return EXIT_FAILURE;
  }
  lgr.info("Completed configuration");

  return EXIT_SUCCESS;
}
