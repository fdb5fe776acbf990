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

#ifndef LIB_PROGRESS_PARSER_HPP_
#define LIB_PROGRESS_PARSER_HPP_

#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace curlew {

/// One progress record of the external tool. Fields are relayed exactly
/// as the tool formats them; a record with fewer fields leaves the
/// remaining ones empty.
struct progress_sample {
  std::string total_percent;
  std::string total_size;
  std::string received_percent;
  std::string received_size;
  std::string transferred_percent;
  std::string transferred_size;
  std::string avg_download_rate;
  std::string avg_upload_rate;
  std::string total_time;
  std::string elapsed_time;
  std::string remaining_time;
  std::string current_rate;

  [[nodiscard]] static auto
  from_record(const std::string_view payload) -> progress_sample;

  auto
  operator==(const progress_sample &) const -> bool = default;
};

/// The line shown to the user for one sample
[[nodiscard]] auto
format_progress(const progress_sample &s) -> std::string;

/// Incremental parser for the tool's progress stream. A record is the
/// text between two '\r' characters; bytes fed so far that do not yet
/// complete a record are kept for the next call to feed.
class progress_parser {
public:
  static constexpr auto delim = '\r';

  [[nodiscard]] auto
  feed(const std::string_view chunk) -> std::vector<progress_sample>;

  /// Bytes retained from previous calls to feed
  [[nodiscard]] auto
  buffered() const noexcept -> std::string_view {
    return buf;
  }

  auto
  reset() noexcept -> void {
    buf.clear();
  }

private:
  std::string buf;
};

}  // namespace curlew

template <>
struct std::formatter<curlew::progress_sample> : std::formatter<std::string> {
  auto
  format(const curlew::progress_sample &s, std::format_context &ctx) const {
    return std::formatter<std::string>::format(curlew::format_progress(s), ctx);
  }
};

#endif  // LIB_PROGRESS_PARSER_HPP_
