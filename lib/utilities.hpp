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

#ifndef LIB_UTILITIES_HPP_
#define LIB_UTILITIES_HPP_

/*
  Functions declared here are used by multiple source files
 */

#include <algorithm>  // IWYU pragma: keep
#include <cctype>     // for std::isgraph
#include <iterator>   // for std::size
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>

[[nodiscard]] inline auto
rstrip(const char *const x) -> const std::string_view {
  const std::string_view s{x};
  const auto start = s.find_first_not_of("\n\r");
  if (start == std::string_view::npos)
    return {};
  const auto stop = s.find_last_not_of("\n\r");
  return s.substr(start, stop - start + 1);
}

[[nodiscard]] inline auto
rlstrip(const std::string_view s) noexcept -> std::string {
  constexpr auto is_graph = [](const unsigned char c) {
    return std::isgraph(c);
  };
  const auto start = std::ranges::find_if(s, is_graph);
  const auto stop = std::ranges::find_if(s | std::views::reverse, is_graph);
  if (start == std::cend(s))
    return {};
  return std::string(start, stop.base());
}

[[nodiscard]] inline auto
join_with(std::ranges::input_range auto &&r, const char delim) -> std::string {
  std::string joined;
  for (const auto &x : r) {
    if (!joined.empty())
      joined += delim;
    joined += x;
  }
  return joined;
}

[[nodiscard]] auto
split_equals(const std::string &line, std::error_code &error) noexcept
  -> std::tuple<std::string, std::string>;

#endif  // LIB_UTILITIES_HPP_
