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

#include "transport_options.hpp"

#include "environment_utilities.hpp"
#include "transport_config.hpp"

#include <filesystem>
#include <format>
#include <string>
#include <system_error>
#include <vector>

namespace curlew {

[[nodiscard]] static auto
get_ca_bundle_path(const std::string &embedded_dir) -> std::string {
  const auto bundle =
    std::filesystem::path(embedded_dir) / transport_options::ca_bundle_filename;
  std::error_code error;
  const auto abs_bundle = std::filesystem::absolute(bundle, error);
  // absolute only fails if the current directory is unavailable
  return error ? bundle.lexically_normal().string()
               : abs_bundle.lexically_normal().string();
}

[[nodiscard]] auto
build_transport_options(const transport_config &config) -> transport_options {
  transport_options opts;
  auto &args = opts.args;
  // clang-format off
  args = {
    "--fail",
    "--location",
    "--max-redirs", std::format("{}", transport_options::max_redirects),
    "--user-agent", get_user_agent(),
  };
  // clang-format on
  if (!config.ca_cert.empty()) {
    args.emplace_back("--cacert");
    args.emplace_back(config.ca_cert);
  }
  if (!config.ca_path.empty()) {
    args.emplace_back("--capath");
    args.emplace_back(config.ca_path);
  }
  if (config.resume) {
    args.emplace_back("--continue-at");
    args.emplace_back("-");
  }
  if (config.insecure)
    args.emplace_back("--insecure");
  if (!config.client_cert.empty()) {
    args.emplace_back("--cert");
    args.emplace_back(config.client_cert);
  }
  if (!config.auth.empty()) {
    args.emplace_back("-u");
    args.emplace_back(config.auth);
  }
  for (const auto &header : config.headers) {
    args.emplace_back("-H");
    args.emplace_back(header);
  }

  if (config.installer_mode)
    opts.env.emplace_back(transport_options::ca_bundle_env,
                          get_ca_bundle_path(config.installer_embedded_dir));
  return opts;
}

[[nodiscard]] auto
redact_args(const std::vector<std::string> &args) -> std::vector<std::string> {
  std::vector<std::string> r(args);
  for (std::size_t i = 1; i < std::size(r); ++i)
    if (r[i - 1] == "-u")
      r[i] = transport_options::redacted;
  return r;
}

}  // namespace curlew
