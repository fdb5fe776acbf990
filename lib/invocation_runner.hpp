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

#ifndef LIB_INVOCATION_RUNNER_HPP_
#define LIB_INVOCATION_RUNNER_HPP_

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <vector>

namespace curlew {

/// Everything observed about one run of the external tool
struct invocation_result {
  int exit_code{};
  std::string stdout_data;
  std::string stderr_data;
  bool was_cancelled{};
};

/// Receives each chunk of the tool's stderr as it arrives
using stderr_consumer = std::function<void(std::string_view)>;

/// Runs the external tool as a child process, capturing its output and
/// supporting termination while it runs. One invocation at a time per
/// instance; cancel() may be called from any thread.
class invocation_runner {
public:
  static constexpr auto kill_grace_default = std::chrono::milliseconds(2000);
  static constexpr auto wait_poll_interval = std::chrono::milliseconds(20);
  static constexpr auto drain_timeout = std::chrono::milliseconds(1000);
  static constexpr std::uint32_t read_buf_size = 4096;

  explicit invocation_runner(std::string tool) : tool{std::move(tool)} {}

  invocation_runner(const invocation_runner &) = delete;
  auto
  operator=(const invocation_runner &) -> invocation_runner & = delete;

  /// Run the tool with the given arguments and environment overrides and
  /// wait for it to exit. Sets 'error' only if the tool could not be
  /// started; a tool that starts and fails is reported in the result.
  [[nodiscard]] auto
  run(const std::vector<std::string> &args,
      const std::vector<std::tuple<std::string, std::string>> &env,
      const stderr_consumer &on_stderr, std::stop_token stop_token,
      std::error_code &error) -> invocation_result;

  [[nodiscard]] auto
  run(const std::vector<std::string> &args,
      const std::vector<std::tuple<std::string, std::string>> &env,
      const stderr_consumer &on_stderr,
      std::error_code &error) -> invocation_result {
    return run(args, env, on_stderr, std::stop_token{}, error);
  }

  /// Terminate the running invocation, if there is one. Once run() has
  /// been entered, a cancel always wins: before the child is started it
  /// is never started, after that it is terminated.
  auto
  cancel() noexcept -> void;

  /// True from the moment run() is entered until it returns
  [[nodiscard]] auto
  is_running() const -> bool;

  auto
  set_kill_grace(const std::chrono::milliseconds grace) noexcept -> void {
    kill_grace = grace;
  }

  [[nodiscard]] auto
  get_tool() const noexcept -> const std::string & {
    return tool;
  }

private:
  struct invocation;

  static auto
  post_terminate(invocation &inv) -> void;

  [[nodiscard]] auto
  cancel_was_requested() -> bool;

  std::string tool;
  std::chrono::milliseconds kill_grace{kill_grace_default};
  mutable std::mutex mtx;
  // guarded by mtx
  std::shared_ptr<invocation> active;
  bool running{};
  bool cancel_requested{};
};

}  // namespace curlew

template <>
struct std::formatter<curlew::invocation_result> : std::formatter<std::string> {
  auto
  format(const curlew::invocation_result &r, std::format_context &ctx) const {
    return std::format_to(ctx.out(),
                          R"({{"exit_code": {}, "stdout_bytes": {}, )"
                          R"("stderr_bytes": {}, "was_cancelled": {}}})",
                          r.exit_code, r.stdout_data.size(),
                          r.stderr_data.size(), r.was_cancelled);
  }
};

#endif  // LIB_INVOCATION_RUNNER_HPP_
