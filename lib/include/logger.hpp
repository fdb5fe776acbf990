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

#ifndef LIB_INCLUDE_LOGGER_HPP_
#define LIB_INCLUDE_LOGGER_HPP_

#include <boost/describe.hpp>        // for BOOST_DESCRIBE_ENUM
#include <boost/mp11/algorithm.hpp>  // for mp_for_each

#include <atomic>
#include <cstdint>
#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>  // for std::forward

namespace curlew {

/*
  Each line written by the logger:
  YYYY-MM-DD HH:MM:SS hostname appname[pid] LEVEL message
*/

enum class log_level_t : std::uint8_t {
  debug,
  info,
  warning,
  error,
  critical,
};

// clang-format off
BOOST_DESCRIBE_ENUM(
  log_level_t,
  debug,
  info,
  warning,
  error,
  critical
)
// clang-format on

[[nodiscard]] inline auto
to_name(const log_level_t l) noexcept -> std::string_view {
  const char *name = boost::describe::enum_to_string(l, "unknown");
  return name;
}

/// Map from level names to levels, for CLI11 transformers
[[nodiscard]] inline auto
make_log_level_map() -> std::map<std::string, log_level_t> {
  std::map<std::string, log_level_t> r;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<log_level_t>>(
    [&](const auto d) { r.emplace(d.name, d.value); });
  return r;
}

static const auto log_level_cli11 = make_log_level_map();

inline auto
operator<<(std::ostream &o, const log_level_t &l) -> std::ostream & {
  return o << to_name(l);
}

inline auto
operator>>(std::istream &in, log_level_t &l) -> std::istream & {
  std::string tmp;
  if (!(in >> tmp))
    return in;
  if (!boost::describe::enum_from_string(tmp.data(), l))
    in.setstate(std::ios::failbit);
  return in;
}

[[nodiscard]] inline auto
shared_from_cout() -> std::shared_ptr<std::ostream> {
  return std::make_shared<std::ostream>(std::cout.rdbuf());
}

[[nodiscard]] inline auto
shared_from_cerr() -> std::shared_ptr<std::ostream> {
  return std::make_shared<std::ostream>(std::cerr.rdbuf());
}

class logger {
public:
  static constexpr log_level_t default_level{log_level_t::info};
  // longer messages are truncated
  static constexpr std::size_t max_message_size{1024};

  // The first call determines the stream and attributes; later calls
  // with arguments are ignored and just return the instance.
  static auto
  instance(const std::shared_ptr<std::ostream> &log_file_ptr = nullptr,
           const std::string &appname = "",
           log_level_t min_log_level = log_level_t::debug) -> logger & {
    static logger lgr(log_file_ptr ? log_file_ptr : shared_from_cerr(),
                      appname, min_log_level);
    return lgr;
  }

  [[nodiscard]] auto
  get_status() const -> std::error_code {
    return status;
  }

  /// Settings files can change the level after the logger exists
  static auto
  set_level(const log_level_t lvl) noexcept -> void {
    instance().min_log_level.store(lvl);
  }

  [[nodiscard]] auto
  get_level() const noexcept -> log_level_t {
    return min_log_level.load();
  }

  operator bool() const { return status ? false : true; }

  template <log_level_t the_level, typename... Args>
  auto
  log(std::format_string<Args...> fmt, Args &&...args) -> void {
    if (the_level >= min_log_level.load())
      write_line(the_level, std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  auto
  debug(std::format_string<Args...> fmt, Args &&...args) -> void {
    log<log_level_t::debug>(fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  auto
  info(std::format_string<Args...> fmt, Args &&...args) -> void {
    log<log_level_t::info>(fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  auto
  warning(std::format_string<Args...> fmt, Args &&...args) -> void {
    log<log_level_t::warning>(fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  auto
  error(std::format_string<Args...> fmt, Args &&...args) -> void {
    log<log_level_t::error>(fmt, std::forward<Args>(args)...);
  }
  template <typename... Args>
  auto
  critical(std::format_string<Args...> fmt, Args &&...args) -> void {
    log<log_level_t::critical>(fmt, std::forward<Args>(args)...);
  }

  logger(const logger &) = delete;
  auto
  operator=(const logger &) -> logger & = delete;

private:
  logger(const std::shared_ptr<std::ostream> &log_file,
         const std::string &appname, log_level_t min_log_level);
  ~logger() = default;

  auto
  write_line(const log_level_t lvl, std::string_view msg) -> void;

  std::shared_ptr<std::ostream> log_file;
  // hostname, appname and pid
  std::string prefix;
  std::mutex mtx;
  std::atomic<log_level_t> min_log_level{default_level};
  std::error_code status;
};

template <log_level_t lvl>
auto
log_args(std::ranges::input_range auto &&key_value_pairs) {
  logger &lgr = logger::instance();
  for (auto &&[k, v] : key_value_pairs)
    lgr.log<lvl>("{}: {}", k, v);
}

}  // namespace curlew

// Error codes in log lines carry their category, so a failure to start
// the tool reads differently from a settings or uri error
template <>
struct std::formatter<std::error_code> : std::formatter<std::string> {
  auto
  format(const std::error_code &e, std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{}: {}", e.category().name(),
                          e.message());
  }
};

template <>
struct std::formatter<curlew::log_level_t> : std::formatter<std::string_view> {
  auto
  format(const curlew::log_level_t &lvl, std::format_context &ctx) const {
    return std::formatter<std::string_view>::format(curlew::to_name(lvl), ctx);
  }
};

#endif  // LIB_INCLUDE_LOGGER_HPP_
