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

#ifndef LIB_TRANSFER_COORDINATOR_HPP_
#define LIB_TRANSFER_COORDINATOR_HPP_

#include "invocation_runner.hpp"
#include "transfer_outcome.hpp"

#include <chrono>
#include <stop_token>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>  // for std::move

namespace curlew {

struct transfer_request;
class transfer_ui;

/// Runs transfers with the external tool. An instance runs one transfer
/// at a time; separate instances are independent.
class transfer_coordinator {
public:
  explicit transfer_coordinator(const std::string &tool,
                                transfer_ui *ui = nullptr) :
    runner{tool}, ui{ui} {}

  /// Download the request's source to its destination, showing progress
  /// if there is a UI. The 'error' is set only if the tool could not be
  /// started at all; the outcome is then a tool_error carrying the system
  /// error message, and 'error' is what tells the two failures apart.
  [[nodiscard]] auto
  fetch_to_file(const transfer_request &req, std::stop_token stop_token,
                std::error_code &error) -> transfer_outcome;

  /// Request only the response headers of the source; these are returned
  /// as the tool printed them. Failure to start the tool is reported as
  /// for fetch_to_file.
  [[nodiscard]] auto
  probe_headers(const transfer_request &req, std::stop_token stop_token,
                std::error_code &error)
    -> std::tuple<std::string, transfer_outcome>;

#ifndef CURLEW_NOEXCEPT
  /// Overload of fetch_to_file that throws system_error if the tool could
  /// not be started
  [[nodiscard]] auto
  fetch_to_file(const transfer_request &req,
                std::stop_token stop_token = {}) -> transfer_outcome {
    std::error_code error;
    auto outcome = fetch_to_file(req, std::move(stop_token), error);
    if (error)
      throw std::system_error(error, runner.get_tool());
    return outcome;
  }

  [[nodiscard]] auto
  probe_headers(const transfer_request &req, std::stop_token stop_token = {})
    -> std::tuple<std::string, transfer_outcome> {
    std::error_code error;
    auto r = probe_headers(req, std::move(stop_token), error);
    if (error)
      throw std::system_error(error, runner.get_tool());
    return r;
  }
#endif

  /// Stop the transfer in progress, if any. May be called from any
  /// thread while a transfer is running.
  auto
  cancel() noexcept -> void {
    runner.cancel();
  }

  [[nodiscard]] auto
  is_running() const -> bool {
    return runner.is_running();
  }

  auto
  set_kill_grace(const std::chrono::milliseconds grace) noexcept -> void {
    runner.set_kill_grace(grace);
  }

private:
  [[nodiscard]] auto
  finish(const invocation_result &result) const -> transfer_outcome;

  invocation_runner runner;
  transfer_ui *ui{};
};

}  // namespace curlew

#endif  // LIB_TRANSFER_COORDINATOR_HPP_
