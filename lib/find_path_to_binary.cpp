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

#include "find_path_to_binary.hpp"

#include <unistd.h>  // for access, X_OK

#include <cerrno>
#include <cstdlib>  // for std::getenv
#include <filesystem>
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>

namespace curlew {

[[nodiscard]] static auto
is_executable_file(const std::filesystem::path &p) noexcept -> bool {
  std::error_code ignored_error;
  return std::filesystem::is_regular_file(p, ignored_error) &&
         access(p.c_str(), X_OK) == 0;
}

[[nodiscard]] auto
find_path_to_binary(const std::string &name,
                    std::error_code &error) noexcept -> std::string {
  if (name.empty()) {
    error = std::make_error_code(std::errc::invalid_argument);
    return {};
  }

  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name))
      return name;
    error = std::make_error_code(access(name.data(), X_OK) == 0
                                   ? std::errc::permission_denied
                                   : std::errc(errno));
    return {};
  }

  // ADS: same default as execvp uses when PATH is not set
  static constexpr auto path_default = "/bin:/usr/bin";
  const auto env_path = std::getenv("PATH");
  const std::string_view search_path = env_path ? env_path : path_default;

  for (const auto dir : search_path | std::views::split(':')) {
    // empty element means the current directory
    const std::string_view d(std::cbegin(dir), std::cend(dir));
    const auto candidate =
      (d.empty() ? std::filesystem::path{"."} : std::filesystem::path{d}) /
      name;
    if (is_executable_file(candidate))
      return candidate.string();
  }
  error = std::make_error_code(std::errc::no_such_file_or_directory);
  return {};
}

}  // namespace curlew
