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

#ifndef LIB_TRANSPORT_OPTIONS_HPP_
#define LIB_TRANSPORT_OPTIONS_HPP_

#include <format>
#include <string>
#include <tuple>
#include <vector>

namespace curlew {

struct transport_config;

struct transport_options {
  static constexpr auto max_redirects = 10;
  static constexpr auto ca_bundle_env = "CURL_CA_BUNDLE";
  static constexpr auto ca_bundle_filename = "cacert.pem";
  static constexpr auto redacted = "<redacted>";

  std::vector<std::string> args;
  // name, value
  std::vector<std::tuple<std::string, std::string>> env;
};

/// Arguments and environment overrides for the external tool, without
/// the operation-specific arguments or the source.
[[nodiscard]] auto
build_transport_options(const transport_config &config) -> transport_options;

/// Copy of the arguments safe for logging: the value after '-u' is masked.
[[nodiscard]] auto
redact_args(const std::vector<std::string> &args) -> std::vector<std::string>;

}  // namespace curlew

template <>
struct std::formatter<curlew::transport_options> : std::formatter<std::string> {
  auto
  format(const curlew::transport_options &o, std::format_context &ctx) const {
    const auto args = curlew::redact_args(o.args);
    auto out = std::format_to(ctx.out(), "args: [");
    bool first = true;
    for (const auto &a : args) {
      out = std::format_to(out, first ? "\"{}\"" : ", \"{}\"", a);
      first = false;
    }
    out = std::format_to(out, "], env: [");
    first = true;
    for (const auto &[k, v] : o.env) {
      out = std::format_to(out, first ? "{}={}" : ", {}={}", k, v);
      first = false;
    }
    return std::format_to(out, "]");
  }
};

#endif  // LIB_TRANSPORT_OPTIONS_HPP_
