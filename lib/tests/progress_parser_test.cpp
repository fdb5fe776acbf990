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

#include <progress_parser.hpp>

#include <gtest/gtest.h>

#include <format>
#include <iterator>  // for std::size
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace curlew;  // NOLINT

TEST(progress_parser_test, record_split_across_chunks) {
  progress_parser parser;
  auto samples = parser.feed("\r12 1024 5 50 8 80 1k 0 00:01 00:00 00:01 2");
  EXPECT_TRUE(samples.empty());
  samples = parser.feed(" k\r");
  ASSERT_EQ(std::size(samples), 1u);
  EXPECT_EQ(samples[0].total_percent, "12");
  EXPECT_EQ(samples[0].total_size, "1024");
  EXPECT_EQ(samples[0].current_rate, "2");
  EXPECT_EQ(samples[0].remaining_time, "00:01");
}

TEST(progress_parser_test, two_records_in_one_chunk) {
  progress_parser parser;
  const auto samples = parser.feed("\r10 2M 10 200k 0 0 50k 0 0:00:40 0:00:04 "
                                   "0:00:36 50k\r"
                                   "\r20 2M 20 400k 0 0 55k 0 0:00:36 0:00:07 "
                                   "0:00:29 60k\r");
  ASSERT_EQ(std::size(samples), 2u);
  EXPECT_EQ(samples[0].total_percent, "10");
  EXPECT_EQ(samples[1].total_percent, "20");
  EXPECT_EQ(samples[1].remaining_time, "0:00:29");
  EXPECT_TRUE(parser.buffered().empty());
}

TEST(progress_parser_test, partial_record_retained) {
  progress_parser parser;
  const auto samples = parser.feed("\r 5 100k 5");
  EXPECT_TRUE(samples.empty());
  EXPECT_EQ(parser.buffered(), "\r 5 100k 5");
}

TEST(progress_parser_test, leading_bytes_before_record_dropped) {
  progress_parser parser;
  const auto samples = parser.feed("  % Total    % Received\r1 2 3\r\r4");
  ASSERT_EQ(std::size(samples), 1u);
  EXPECT_EQ(samples[0].total_percent, "1");
  EXPECT_EQ(samples[0].total_size, "2");
  EXPECT_EQ(samples[0].received_percent, "3");
  EXPECT_EQ(parser.buffered(), "\r4");
}

TEST(progress_parser_test, text_without_delimiters_not_retained) {
  progress_parser parser;
  const auto samples = parser.feed("curl: (6) Could not resolve host\n");
  EXPECT_TRUE(samples.empty());
  EXPECT_TRUE(parser.buffered().empty());
}

TEST(progress_parser_test, empty_chunks) {
  progress_parser parser;
  EXPECT_TRUE(parser.feed("").empty());
  EXPECT_TRUE(parser.feed("\r").empty());
  EXPECT_TRUE(parser.feed("").empty());
  const auto samples = parser.feed("7 8\r");
  ASSERT_EQ(std::size(samples), 1u);
  EXPECT_EQ(samples[0].total_percent, "7");
  EXPECT_EQ(samples[0].total_size, "8");
}

TEST(progress_parser_test, blank_record_not_emitted) {
  progress_parser parser;
  const auto samples = parser.feed("\r   \r\r1\r");
  ASSERT_EQ(std::size(samples), 1u);
  EXPECT_EQ(samples[0].total_percent, "1");
}

TEST(progress_parser_test, byte_at_a_time) {
  static constexpr std::string_view stream =
    "\r100 4096 100 4096 0 0 8192 0 0:00:01 0:00:01 --:--:-- 8192\r";
  progress_parser parser;
  std::vector<progress_sample> samples;
  for (const auto c : stream)
    for (auto &s : parser.feed(std::string_view(&c, 1)))
      samples.push_back(std::move(s));
  ASSERT_EQ(std::size(samples), 1u);
  EXPECT_EQ(samples[0].remaining_time, "--:--:--");
  EXPECT_EQ(samples[0].current_rate, "8192");
}

TEST(progress_parser_test, missing_fields_are_empty) {
  const auto s = progress_sample::from_record(" 42  1M ");
  EXPECT_EQ(s.total_percent, "42");
  EXPECT_EQ(s.total_size, "1M");
  EXPECT_TRUE(s.received_percent.empty());
  EXPECT_TRUE(s.current_rate.empty());
}

TEST(progress_parser_test, all_fields_by_position) {
  const auto s =
    progress_sample::from_record("0 1 2 3 4 5 6 7 8 9 10 11 extra fields");
  EXPECT_EQ(s.total_percent, "0");
  EXPECT_EQ(s.total_size, "1");
  EXPECT_EQ(s.received_percent, "2");
  EXPECT_EQ(s.received_size, "3");
  EXPECT_EQ(s.transferred_percent, "4");
  EXPECT_EQ(s.transferred_size, "5");
  EXPECT_EQ(s.avg_download_rate, "6");
  EXPECT_EQ(s.avg_upload_rate, "7");
  EXPECT_EQ(s.total_time, "8");
  EXPECT_EQ(s.elapsed_time, "9");
  EXPECT_EQ(s.remaining_time, "10");
  EXPECT_EQ(s.current_rate, "11");
}

TEST(progress_parser_test, format_progress_line) {
  const auto s = progress_sample::from_record(
    "12 1024 5 50 8 80 1k 0 00:01 00:00 00:03 2k");
  EXPECT_EQ(format_progress(s),
            "Progress: 12% (Rate: 2k/s, Estimated time remaining: 00:03)");
  EXPECT_EQ(std::format("{}", s), format_progress(s));
}
