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

#include "result_classifier.hpp"

#include <regex>
#include <string>
#include <string_view>

namespace curlew {

[[nodiscard]] auto
extract_tool_message(const std::string_view stderr_data) -> std::string {
  static const std::regex marker(R"(\n*curl:\s+\(\d+\)\s*)");
  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_search(std::cbegin(stderr_data), std::cend(stderr_data), m,
                         marker))
    return {};
  std::string_view msg(m[0].second, std::cend(stderr_data));
  if (msg.ends_with("\r\n"))
    msg.remove_suffix(2);
  else if (msg.ends_with('\n') || msg.ends_with('\r'))
    msg.remove_suffix(1);
  return std::string(msg);
}

[[nodiscard]] auto
classify(const invocation_result &result) -> transfer_outcome {
  if (result.was_cancelled)
    return transfer_outcome::cancelled();
  if (result.exit_code == 0)
    return transfer_outcome::success();
  return transfer_outcome::tool_error(extract_tool_message(result.stderr_data));
}

}  // namespace curlew
