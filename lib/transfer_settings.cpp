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

#include "transfer_settings.hpp"

#include "config_file_utils.hpp"
#include "transport_config.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace curlew {

[[nodiscard]] auto
transfer_settings::read(const std::string &config_file,
                        std::error_code &error) noexcept -> transfer_settings {
  transfer_settings settings;
  std::error_code parse_error;
  parse_config_file(settings, config_file, parse_error);
  if (parse_error) {
    auto &lgr = logger::instance();
    lgr.debug("Error reading settings file {}: {}", config_file, parse_error);
    error = parse_error.category() == std::generic_category()
                && parse_error != std::errc::invalid_argument
              ? transfer_settings_error_code::failed_to_read_settings_file
              : transfer_settings_error_code::failed_to_parse_settings_file;
    return {};
  }
  return settings;
}

auto
transfer_settings::read_config_file_no_overwrite(
  const std::string &config_file, std::error_code &error) noexcept -> void {
  const auto tmp = transfer_settings::read(config_file, error);
  if (error)
    return;
  if (tool.empty() || tool == tool_default)
    tool = tmp.tool;
  if (ca_cert.empty())
    ca_cert = tmp.ca_cert;
  if (ca_path.empty())
    ca_path = tmp.ca_path;
  if (client_cert.empty())
    client_cert = tmp.client_cert;
  insecure = insecure || tmp.insecure;
  installer_mode = installer_mode || tmp.installer_mode;
}

[[nodiscard]] auto
transfer_settings::write(const std::string &config_file) const noexcept
  -> std::error_code {
  const auto dirname = std::filesystem::path(config_file).parent_path();
  if (!dirname.empty()) {
    std::error_code error;
    std::filesystem::create_directories(dirname, error);
    if (error)
      return transfer_settings_error_code::error_creating_directories;
  }
  const auto error = write_config_file(*this, config_file);
  if (error)
    return transfer_settings_error_code::error_writing_settings_file;
  return {};
}

auto
transfer_settings::apply_to(transport_config &config) const -> void {
  if (config.ca_cert.empty())
    config.ca_cert = ca_cert;
  if (config.ca_path.empty())
    config.ca_path = ca_path;
  if (config.client_cert.empty())
    config.client_cert = client_cert;
  config.insecure = config.insecure || insecure;
  config.installer_mode = config.installer_mode || installer_mode;
}

auto
transfer_settings::make_paths_absolute() noexcept -> void {
  namespace fs = std::filesystem;
  // errors in absolute are for std::bad_alloc
  std::error_code ignored_error;
  if (!ca_cert.empty())
    ca_cert = fs::absolute(ca_cert, ignored_error).string();
  if (!ca_path.empty())
    ca_path = fs::absolute(ca_path, ignored_error).string();
  if (!client_cert.empty())
    client_cert = fs::absolute(client_cert, ignored_error).string();
}

[[nodiscard]] auto
transfer_settings::tostring() const -> std::string {
  return format_as_config(*this);
}

}  // namespace curlew
