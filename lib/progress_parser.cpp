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

#include "progress_parser.hpp"

#include <array>
#include <cctype>
#include <format>
#include <iterator>  // for std::size
#include <string>
#include <string_view>
#include <vector>

namespace curlew {

[[nodiscard]] auto
progress_sample::from_record(const std::string_view payload)
  -> progress_sample {
  progress_sample s;
  // positions are fixed by the tool's output format
  const auto fields = std::array{
    &s.total_percent,       &s.total_size,        &s.received_percent,
    &s.received_size,       &s.transferred_percent, &s.transferred_size,
    &s.avg_download_rate,   &s.avg_upload_rate,   &s.total_time,
    &s.elapsed_time,        &s.remaining_time,    &s.current_rate,
  };
  const auto is_space = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c));
  };
  std::size_t field_idx = 0;
  std::size_t i = 0;
  const auto n = std::size(payload);
  while (field_idx < std::size(fields)) {
    while (i < n && is_space(payload[i]))
      ++i;
    if (i == n)
      break;
    const auto start = i;
    while (i < n && !is_space(payload[i]))
      ++i;
    *fields[field_idx++] = payload.substr(start, i - start);
  }
  return s;
}

[[nodiscard]] auto
format_progress(const progress_sample &s) -> std::string {
  return std::format("Progress: {}% (Rate: {}/s, Estimated time remaining: {})",
                     s.total_percent, s.current_rate, s.remaining_time);
}

[[nodiscard]] static auto
is_blank(const std::string_view s) -> bool {
  for (const auto c : s)
    if (!std::isspace(static_cast<unsigned char>(c)))
      return false;
  return true;
}

[[nodiscard]] auto
progress_parser::feed(const std::string_view chunk)
  -> std::vector<progress_sample> {
  buf.append(chunk);
  std::vector<progress_sample> samples;
  std::size_t consumed = 0;
  for (;;) {
    const auto open = buf.find(delim, consumed);
    if (open == std::string::npos)
      break;
    const auto close = buf.find(delim, open + 1);
    if (close == std::string::npos)
      break;
    const std::string_view payload(buf.data() + open + 1, close - open - 1);
    if (!is_blank(payload))
      samples.push_back(progress_sample::from_record(payload));
    consumed = close + 1;
  }
  // Anything before the next opening delimiter can never be part of a
  // record, so only the partial record is kept
  const auto next_open = buf.find(delim, consumed);
  if (next_open == std::string::npos)
    buf.clear();
  else
    buf.erase(0, next_open);
  return samples;
}

}  // namespace curlew
