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

#ifndef LIB_INTERRUPT_WATCHER_HPP_
#define LIB_INTERRUPT_WATCHER_HPP_

#include <boost/asio.hpp>

#include <stop_token>
#include <thread>

namespace curlew {

/// Turns SIGINT, SIGTERM and SIGQUIT into a stop request. Signals are
/// handled on a background thread for as long as the watcher exists.
class interrupt_watcher {
public:
  interrupt_watcher();
  ~interrupt_watcher();

  interrupt_watcher(const interrupt_watcher &) = delete;
  auto
  operator=(const interrupt_watcher &) -> interrupt_watcher & = delete;

  [[nodiscard]] auto
  get_token() const noexcept -> std::stop_token {
    return stop_src.get_token();
  }

  [[nodiscard]] auto
  stop_requested() const noexcept -> bool {
    return stop_src.stop_requested();
  }

private:
  auto
  do_await_stop() -> void;

  boost::asio::io_context ioc;
  boost::asio::signal_set signals;
  std::stop_source stop_src;
  std::jthread worker;
};

}  // namespace curlew

#endif  // LIB_INTERRUPT_WATCHER_HPP_
