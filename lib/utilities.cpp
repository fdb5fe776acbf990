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

#include "utilities.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>  // for std::move

[[nodiscard]] auto
split_equals(const std::string &line, std::error_code &error) noexcept
  -> std::tuple<std::string, std::string> {
  const auto key_ok = [](const unsigned char x) { return std::isgraph(x); };
  const auto eq_pos = line.find('=');
  // values may have embedded spaces (e.g., paths) but keys may not
  auto key = eq_pos == std::string::npos ? std::string{}
                                         : rlstrip(line.substr(0, eq_pos));
  auto value = eq_pos == std::string::npos ? std::string{}
                                           : rlstrip(line.substr(eq_pos + 1));
  if (key.empty() || value.empty() || !std::ranges::all_of(key, key_ok)) {
    error = std::make_error_code(std::errc::invalid_argument);
    return {};
  }
  return {std::move(key), std::move(value)};
}
