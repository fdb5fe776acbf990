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

#include <logger.hpp>
#include <transfer_settings.hpp>
#include <transport_config.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using namespace curlew;  // NOLINT

class transfer_settings_test : public ::testing::Test {
protected:
  auto
  SetUp() -> void override {
    logger::instance(shared_from_cout(), "none", log_level_t::debug);
    config_dir = generate_unique_dir_name();
    config_file =
      (std::filesystem::path(config_dir) / "sub" / "curlew.conf").string();
  }

  auto
  TearDown() -> void override {
    std::error_code error;
    remove_directories(config_dir, error);
    EXPECT_FALSE(error) << error.message();
  }

public:
  std::string config_dir;
  std::string config_file;
};

TEST_F(transfer_settings_test, defaults) {
  const transfer_settings settings;
  EXPECT_EQ(settings.tool, "curl");
  EXPECT_TRUE(settings.ca_cert.empty());
  EXPECT_FALSE(settings.insecure);
  EXPECT_EQ(settings.log_level, log_level_t::info);
}

TEST_F(transfer_settings_test, write_then_read) {
  transfer_settings settings;
  settings.tool = "/usr/local/bin/curl";
  settings.ca_cert = "/etc/ssl/my ca.pem";
  settings.insecure = true;
  settings.log_level = log_level_t::debug;
  const auto write_error = settings.write(config_file);
  ASSERT_FALSE(write_error) << write_error.message();

  std::error_code error;
  const auto read_back = transfer_settings::read(config_file, error);
  EXPECT_FALSE(error) << error.message();
  EXPECT_EQ(read_back.tool, "/usr/local/bin/curl");
  EXPECT_EQ(read_back.ca_cert, "/etc/ssl/my ca.pem");
  EXPECT_TRUE(read_back.ca_path.empty());
  EXPECT_TRUE(read_back.insecure);
  EXPECT_FALSE(read_back.installer_mode);
  EXPECT_EQ(read_back.log_level, log_level_t::debug);
}

TEST_F(transfer_settings_test, read_missing_file) {
  std::error_code error;
  [[maybe_unused]] const auto settings =
    transfer_settings::read(config_file, error);
  EXPECT_EQ(error, transfer_settings_error_code::failed_to_read_settings_file);
}

TEST_F(transfer_settings_test, read_malformed_file) {
  std::filesystem::create_directories(
    std::filesystem::path(config_file).parent_path());
  {
    std::ofstream out(config_file);
    out << "tool curl\n";
  }
  std::error_code error;
  [[maybe_unused]] const auto settings =
    transfer_settings::read(config_file, error);
  EXPECT_EQ(error, transfer_settings_error_code::failed_to_parse_settings_file);
}

TEST_F(transfer_settings_test, read_bad_log_level) {
  std::filesystem::create_directories(
    std::filesystem::path(config_file).parent_path());
  {
    std::ofstream out(config_file);
    out << "log-level = loud\n";
  }
  std::error_code error;
  [[maybe_unused]] const auto settings =
    transfer_settings::read(config_file, error);
  EXPECT_EQ(error, transfer_settings_error_code::failed_to_parse_settings_file);
}

TEST_F(transfer_settings_test, no_overwrite_keeps_given_values) {
  transfer_settings in_file;
  in_file.tool = "wcurl";
  in_file.ca_cert = "/file/ca.pem";
  in_file.client_cert = "/file/client.pem";
  in_file.installer_mode = true;
  ASSERT_FALSE(in_file.write(config_file));

  transfer_settings settings;
  settings.ca_cert = "/cli/ca.pem";
  std::error_code error;
  settings.read_config_file_no_overwrite(config_file, error);
  EXPECT_FALSE(error);
  EXPECT_EQ(settings.tool, "wcurl");
  EXPECT_EQ(settings.ca_cert, "/cli/ca.pem");
  EXPECT_EQ(settings.client_cert, "/file/client.pem");
  EXPECT_TRUE(settings.installer_mode);
}

TEST_F(transfer_settings_test, apply_to_fills_unset_policies) {
  transfer_settings settings;
  settings.ca_cert = "/settings/ca.pem";
  settings.ca_path = "/settings/certs";
  settings.insecure = true;

  transport_config config;
  config.ca_cert = "/cli/ca.pem";
  settings.apply_to(config);
  EXPECT_EQ(config.ca_cert, "/cli/ca.pem");
  EXPECT_EQ(config.ca_path, "/settings/certs");
  EXPECT_TRUE(config.client_cert.empty());
  EXPECT_TRUE(config.insecure);
  EXPECT_FALSE(config.installer_mode);
}

TEST_F(transfer_settings_test, make_paths_absolute) {
  transfer_settings settings;
  settings.ca_cert = "ca.pem";
  settings.make_paths_absolute();
  EXPECT_TRUE(std::filesystem::path(settings.ca_cert).is_absolute());
  EXPECT_TRUE(settings.ca_path.empty());
}
