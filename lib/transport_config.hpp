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

#ifndef LIB_TRANSPORT_CONFIG_HPP_
#define LIB_TRANSPORT_CONFIG_HPP_

#include <format>
#include <string>
#include <vector>

namespace curlew {

/// Transport policies for one request. Empty strings mean the policy is
/// absent; headers are passed along in the given order.
struct transport_config {
  std::string auth;
  std::string ca_cert;
  std::string ca_path;
  std::string client_cert;
  bool resume{};
  bool insecure{};
  std::vector<std::string> headers;
  // packaged deployment: use the CA bundle shipped in the install tree
  bool installer_mode{};
  std::string installer_embedded_dir;

  auto
  operator==(const transport_config &) const -> bool = default;
};

}  // namespace curlew

template <>
struct std::formatter<curlew::transport_config> : std::formatter<std::string> {
  auto
  format(const curlew::transport_config &c, std::format_context &ctx) const {
    // auth is never printed
    return std::format_to(
      ctx.out(),
      R"({{"auth": {}, "ca_cert": "{}", "ca_path": "{}", "client_cert": "{}", )"
      R"("resume": {}, "insecure": {}, "headers": {}, "installer_mode": {}, )"
      R"("installer_embedded_dir": "{}"}})",
      !c.auth.empty(), c.ca_cert, c.ca_path, c.client_cert, c.resume,
      c.insecure, c.headers.size(), c.installer_mode,
      c.installer_embedded_dir);
  }
};

#endif  // LIB_TRANSPORT_CONFIG_HPP_
