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

#include "logger.hpp"

#include <unistd.h>  // for gethostname, getpid

#include <algorithm>  // for std::ranges::transform
#include <array>
#include <cctype>  // for std::toupper
#include <cerrno>
#include <chrono>
#include <ctime>  // for localtime_r, std::strftime
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

namespace curlew {

logger::logger(const std::shared_ptr<std::ostream> &log_file,
               const std::string &appname, log_level_t min_log_level) :
  log_file{log_file}, min_log_level{min_log_level} {
  if (log_file == nullptr || !log_file->good()) {
    status = std::make_error_code(std::errc::bad_file_descriptor);
    return;
  }
  static constexpr std::size_t max_hostname_size{256};
  std::array<char, max_hostname_size> hostname{};
  if (gethostname(hostname.data(), max_hostname_size) != 0) {
    status = std::make_error_code(std::errc(errno));
    return;
  }
  hostname.back() = '\0';
  prefix = std::format("{} {}[{}]", hostname.data(), appname, getpid());
}

auto
logger::write_line(const log_level_t lvl, std::string_view msg) -> void {
  // "YYYY-MM-DD HH:MM:SS" plus the terminating null
  static constexpr std::size_t date_time_size{20};
  std::array<char, date_time_size> date_time{};
  const auto now = std::chrono::system_clock::to_time_t(
    std::chrono::system_clock::now());
  struct tm tm {};
  localtime_r(&now, &tm);  // localtime_r is thread-safe
  std::strftime(date_time.data(), date_time_size, "%Y-%m-%d %H:%M:%S", &tm);

  std::string level_name{to_name(lvl)};
  std::ranges::transform(level_name, std::begin(level_name), [](const char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });

  msg = msg.substr(0, max_message_size);
  const auto line = std::format("{} {} {} {}\n", date_time.data(), prefix,
                                level_name, msg);
  std::lock_guard lck{mtx};
  log_file->write(line.data(), static_cast<std::streamsize>(std::size(line)));
  log_file->flush();
}

}  // namespace curlew
