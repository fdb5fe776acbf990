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

#include "environment_utilities.hpp"

#include <config.h>

#include <cstdlib>  // for std::getenv
#include <filesystem>
#include <format>
#include <string>
#include <system_error>

namespace curlew {

[[nodiscard]] auto
get_installer_embedded_dir() -> std::string {
  const auto env_dir = std::getenv(installer_embedded_dir_env);
  return env_dir ? std::string{env_dir} : std::string{};
}

[[nodiscard]] auto
get_default_config_file(std::error_code &error) -> std::string {
  const auto env_home = std::getenv("HOME");
  if (!env_home) {
    error = std::make_error_code(std::errc::not_a_directory);
    return {};
  }
  const auto env_home_path = std::filesystem::absolute(env_home, error);
  if (error)
    return {};
  return (env_home_path / config_dirname_default / config_filename_default)
    .string();
}

[[nodiscard]] auto
get_version() -> std::string {
  return VERSION;
}

[[nodiscard]] auto
get_user_agent() -> std::string {
  return std::format("{}/{}", PROJECT_NAME, VERSION);
}

}  // namespace curlew
