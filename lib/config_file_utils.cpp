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

#include "config_file_utils.hpp"

#include "logger.hpp"
#include "utilities.hpp"

#include <cerrno>
#include <cstddef>
#include <fstream>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>  // for std::move
#include <vector>

namespace curlew {

[[nodiscard]] auto
parse_config_file_as_key_val(const std::string &filename,
                             std::error_code &error) noexcept
  -> std::vector<std::tuple<std::string, std::string>> {
  std::ifstream in(filename);
  if (!in) {
    error = std::make_error_code(std::errc(errno));
    return {};
  }
  std::vector<std::tuple<std::string, std::string>> key_vals;
  std::size_t line_number{};
  for (std::string line; std::getline(in, line);) {
    ++line_number;
    const auto content = rlstrip(line);
    if (content.empty() || content.front() == '#')
      continue;
    auto key_val = split_equals(content, error);
    if (error) {
      logger::instance().debug("Malformed line {} in {}", line_number,
                               filename);
      return {};
    }
    key_vals.push_back(std::move(key_val));
  }
  if (in.bad()) {
    error = std::make_error_code(std::errc::io_error);
    return {};
  }
  return key_vals;
}

}  // namespace curlew
