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

#include "interrupt_watcher.hpp"

#include "logger.hpp"

#include <boost/asio.hpp>

#include <csignal>
#include <cstring>  // for strsignal
#include <thread>

namespace curlew {

interrupt_watcher::interrupt_watcher() :
#ifdef SIGQUIT
  signals(ioc, SIGINT, SIGTERM, SIGQUIT)
#else
  signals(ioc, SIGINT, SIGTERM)
#endif
{
  do_await_stop();
  worker = std::jthread([this] { ioc.run(); });
}

interrupt_watcher::~interrupt_watcher() {
  ioc.stop();
  // worker joins before the signal set goes away
  worker = std::jthread{};
}

auto
interrupt_watcher::do_await_stop() -> void {
  signals.async_wait(
    [this](const boost::system::error_code ec, const int signo) {
      if (ec)
        return;
      logger::instance().warning("Received signal {}", strsignal(signo));
      stop_src.request_stop();
      do_await_stop();
    });
}

}  // namespace curlew
