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

#ifndef LIB_INCLUDE_ENVIRONMENT_UTILITIES_HPP_
#define LIB_INCLUDE_ENVIRONMENT_UTILITIES_HPP_

#include <string>
#include <system_error>

namespace curlew {

static constexpr auto installer_embedded_dir_env =
  "CURLEW_INSTALLER_EMBEDDED_DIR";
static constexpr auto config_dirname_default = ".config/curlew";
static constexpr auto config_filename_default = "curlew.conf";

/// Directory holding files shipped with a packaged install, or empty
/// if the environment does not name one.
[[nodiscard]] auto
get_installer_embedded_dir() -> std::string;

/// The default settings file: ${HOME}/.config/curlew/curlew.conf
[[nodiscard]] auto
get_default_config_file(std::error_code &error) -> std::string;

[[nodiscard]] auto
get_version() -> std::string;

/// The user agent sent by the external tool on every request
[[nodiscard]] auto
get_user_agent() -> std::string;

}  // namespace curlew

#endif  // LIB_INCLUDE_ENVIRONMENT_UTILITIES_HPP_
