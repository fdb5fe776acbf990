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

#include "unit_test_utils.hpp"

#include <config_file_utils.hpp>

#include <boost/describe.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <system_error>

using namespace curlew;  // NOLINT

struct test_struct {
  int int_member{};
  std::string string_member;
  bool bool_member{};
  BOOST_DESCRIBE_CLASS(test_struct, (),
                       (int_member, string_member, bool_member), (), ())
};

[[nodiscard]] static auto
generate_config(const std::map<std::string, std::string> &key_vals)
  -> std::string {
  std::string config;
  for (const auto &[key, val] : key_vals)
    config += key + " = " + val + "\n";
  return config;
}

class config_file_utils_test : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    config_file = generate_temp_filename("config_file_utils", "conf");
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    [[maybe_unused]] const bool remove_ok =
      std::filesystem::remove(config_file, error);
  }

  auto
  write_payload(const std::string &payload) const -> void {
    std::ofstream out(config_file);
    out << payload;
  }

public:
  std::string config_file;
};

TEST(config_format_test, format_as_config) {
  static constexpr auto expected = R"test(int-member = 42
string-member = example
bool-member = true
)test";
  const test_struct t{42, "example", true};
  EXPECT_EQ(format_as_config(t), expected);
}

TEST(config_format_test, empty_values_commented) {
  static constexpr auto expected = R"test(int-member = 0
# string-member =
bool-member = false
)test";
  const test_struct t{};
  EXPECT_EQ(format_as_config(t), expected);
}

TEST(config_format_test, assign_member) {
  test_struct t{};
  EXPECT_FALSE(assign_member(t, "int_member", "42"));
  EXPECT_FALSE(assign_member(t, "string_member", "an example value"));
  EXPECT_FALSE(assign_member(t, "bool_member", "true"));
  EXPECT_FALSE(assign_member(t, "not_a_member", "1234"));
  EXPECT_EQ(t.int_member, 42);
  EXPECT_EQ(t.string_member, "an example value");
  EXPECT_TRUE(t.bool_member);
}

TEST(config_format_test, assign_member_bad_value) {
  test_struct t{};
  EXPECT_TRUE(assign_member(t, "int_member", "forty-two"));
  EXPECT_TRUE(assign_member(t, "bool_member", "maybe"));
}

TEST_F(config_file_utils_test, write_config_file) {
  static constexpr auto expected = R"test(int-member = 42
string-member = example
bool-member = false
)test";
  const test_struct t{42, "example", false};
  const auto error = write_config_file(t, config_file);
  EXPECT_FALSE(error);
  EXPECT_EQ(read_whole_file(config_file), expected);
}

TEST_F(config_file_utils_test, parse_config) {
  write_payload(generate_config({{"int-member", "42"},
                                 {"string-member", "complex_example"},
                                 {"invalid-key", "1234"}}));
  test_struct t{};
  std::error_code error;
  parse_config_file(t, config_file, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(t.int_member, 42);
  EXPECT_EQ(t.string_member, "complex_example");
}

TEST_F(config_file_utils_test, parse_config_with_comments) {
  write_payload("# a comment\n\n  int-member = 7  \n# string-member =\n");
  test_struct t{};
  std::error_code error;
  parse_config_file(t, config_file, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(t.int_member, 7);
  EXPECT_TRUE(t.string_member.empty());
}

TEST_F(config_file_utils_test, parse_config_with_missing_values) {
  write_payload(generate_config({{"int_member", ""}, {"string_member", "x"}}));
  test_struct t{};
  std::error_code error;
  parse_config_file(t, config_file, error);
  EXPECT_TRUE(error);
}

TEST_F(config_file_utils_test, parse_config_with_special_characters) {
  write_payload(generate_config(
    {{"int_member", "42"},
     {"string_member", "example_with_special_chars!@#$%^&*()"}}));
  test_struct t{};
  std::error_code error;
  parse_config_file(t, config_file, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(t.string_member, "example_with_special_chars!@#$%^&*()");
}

TEST_F(config_file_utils_test, parse_config_with_empty_file) {
  write_payload("");
  test_struct t{};
  std::error_code error;
  parse_config_file(t, config_file, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(t.int_member, 0);
  EXPECT_EQ(t.string_member, "");
}

TEST(config_format_test, parse_missing_file) {
  test_struct t{};
  std::error_code error;
  parse_config_file(t, "/this/file/does/not/exist.conf", error);
  EXPECT_EQ(error, std::errc::no_such_file_or_directory);
}
