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

#include "transfer_coordinator.hpp"

#include "logger.hpp"
#include "progress_parser.hpp"
#include "result_classifier.hpp"
#include "transfer_request.hpp"
#include "transfer_ui.hpp"
#include "transport_options.hpp"

#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>  // for std::move

namespace curlew {

// Whatever happens, no progress line is left behind
struct line_clearer {
  transfer_ui *ui{};
  explicit line_clearer(transfer_ui *ui) : ui{ui} {}
  line_clearer(const line_clearer &) = delete;
  auto
  operator=(const line_clearer &) -> line_clearer & = delete;
  ~line_clearer() {
    if (ui)
      ui->clear_line();
  }
};

[[nodiscard]] auto
transfer_coordinator::finish(const invocation_result &result) const
  -> transfer_outcome {
  auto &lgr = logger::instance();
  lgr.debug("Invocation result: {}", result);
  if (result.was_cancelled)
    lgr.info("Transfer interrupted");
  else if (result.exit_code != 0)
    lgr.warning("Transfer tool exit code: {}", result.exit_code);
  return classify(result);
}

[[nodiscard]] auto
transfer_coordinator::fetch_to_file(const transfer_request &req,
                                    std::stop_token stop_token,
                                    std::error_code &error)
  -> transfer_outcome {
  auto &lgr = logger::instance();
  lgr.info("Starting download");
  lgr.info("Source: {}", req.source);
  lgr.info("Destination: {}", req.destination);

  auto opts = build_transport_options(req.config);
  opts.args.emplace_back("--output");
  opts.args.emplace_back(req.destination);
  opts.args.emplace_back(req.source);
  lgr.debug("Transfer tool: {} {}", runner.get_tool(), opts);

  progress_parser parser;
  stderr_consumer on_stderr;
  if (ui)
    on_stderr = [&](const std::string_view chunk) {
      for (const auto &sample : parser.feed(chunk)) {
        ui->clear_line();
        ui->render_detail(format_progress(sample), false);
      }
    };

  const line_clearer clearer(ui);
  const auto result =
    runner.run(opts.args, opts.env, on_stderr, std::move(stop_token), error);
  if (error) {
    lgr.error("Failed to start {}: {}", runner.get_tool(), error);
    return transfer_outcome::tool_error(error.message());
  }
  return finish(result);
}

[[nodiscard]] auto
transfer_coordinator::probe_headers(const transfer_request &req,
                                    std::stop_token stop_token,
                                    std::error_code &error)
  -> std::tuple<std::string, transfer_outcome> {
  auto &lgr = logger::instance();
  lgr.info("HEAD: {}", req.source);

  auto opts = build_transport_options(req.config);
  opts.args.insert(std::cbegin(opts.args), "-I");
  opts.args.emplace_back(req.source);
  lgr.debug("Transfer tool: {} {}", runner.get_tool(), opts);

  auto result =
    runner.run(opts.args, opts.env, {}, std::move(stop_token), error);
  if (error) {
    lgr.error("Failed to start {}: {}", runner.get_tool(), error);
    return {std::string{}, transfer_outcome::tool_error(error.message())};
  }
  auto outcome = finish(result);
  return {std::move(result.stdout_data), std::move(outcome)};
}

}  // namespace curlew
