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

#ifndef LIB_TRANSFER_SETTINGS_HPP_
#define LIB_TRANSFER_SETTINGS_HPP_

#include "logger.hpp"  // IWYU pragma: keep

#include <boost/describe.hpp>

#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

namespace curlew {

struct transport_config;

/// Persistent settings read from the curlew settings file. Values given
/// on the command line take precedence over these.
struct transfer_settings {
  static constexpr auto tool_default = "curl";

  std::string tool{tool_default};
  std::string ca_cert;
  std::string ca_path;
  std::string client_cert;
  bool insecure{};
  bool installer_mode{};
  log_level_t log_level{logger::default_level};

  /// Read settings from a file; keys not present keep their defaults.
  [[nodiscard]] static auto
  read(const std::string &config_file,
       std::error_code &error) noexcept -> transfer_settings;

#ifndef CURLEW_NOEXCEPT
  [[nodiscard]] static auto
  read(const std::string &config_file) -> transfer_settings {
    std::error_code error;
    auto settings = read(config_file, error);
    if (error)
      throw std::system_error(error, config_file);
    return settings;
  }
#endif

  /// Fill any unset values in *this from those in the file. Flags that
  /// are set in either place remain set.
  auto
  read_config_file_no_overwrite(const std::string &config_file,
                                std::error_code &error) noexcept -> void;

  /// Write the settings file, creating its directory if needed
  [[nodiscard]] auto
  write(const std::string &config_file) const noexcept -> std::error_code;

  /// Copy the settings into a transport config for any policy that the
  /// config does not already have.
  auto
  apply_to(transport_config &config) const -> void;

  auto
  make_paths_absolute() noexcept -> void;

  [[nodiscard]] auto
  tostring() const -> std::string;
};

// clang-format off
BOOST_DESCRIBE_STRUCT(transfer_settings, (), (
  tool,
  ca_cert,
  ca_path,
  client_cert,
  insecure,
  installer_mode,
  log_level
))
// clang-format on

}  // namespace curlew

/// @brief Enum for error codes related to the settings file
enum class transfer_settings_error_code : std::uint8_t {
  ok = 0,
  failed_to_read_settings_file = 1,
  failed_to_parse_settings_file = 2,
  error_creating_directories = 3,
  error_writing_settings_file = 4,
};

template <>
struct std::is_error_code_enum<transfer_settings_error_code>
  : public std::true_type {};

struct transfer_settings_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "transfer_settings";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "failed to read settings file"s;
    case 2: return "failed to parse settings file"s;
    case 3: return "error creating directories"s;
    case 4: return "error writing settings file"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(transfer_settings_error_code e) -> std::error_code {
  static auto category = transfer_settings_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_TRANSFER_SETTINGS_HPP_
