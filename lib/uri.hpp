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

#ifndef LIB_URI_HPP_
#define LIB_URI_HPP_

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

namespace curlew {

/// Components of a URI reference (RFC 3986). Components are kept as
/// written, without percent-decoding; only the scheme is lowercased.
struct uri {
  std::string scheme;
  std::string userinfo;
  std::string host;
  std::string port;
  std::string path;
  std::string query;
  std::string fragment;
  bool has_authority{};
  bool has_query{};
  bool has_fragment{};

  /// True for 'http', 'https' and anything else in the http family
  [[nodiscard]] auto
  is_http() const noexcept -> bool {
    return scheme.starts_with("http");
  }

  [[nodiscard]] auto
  to_string() const -> std::string;

  auto
  operator<=>(const uri &other) const = default;
};

[[nodiscard]] auto
parse_uri(const std::string_view s, std::error_code &error) noexcept -> uri;

}  // namespace curlew

template <>
struct std::formatter<curlew::uri> : std::formatter<std::string> {
  auto
  format(const curlew::uri &u, std::format_context &ctx) const {
    return std::formatter<std::string>::format(u.to_string(), ctx);
  }
};

/// @brief Enum for error codes related to parsing URIs
enum class uri_error_code : std::uint8_t {
  ok = 0,
  empty_uri = 1,
  invalid_character = 2,
  invalid_percent_encoding = 3,
  invalid_scheme = 4,
  invalid_userinfo = 5,
  invalid_host = 6,
  invalid_port = 7,
};

template <>
struct std::is_error_code_enum<uri_error_code> : public std::true_type {};

struct uri_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "uri";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "empty uri"s;
    case 2: return "invalid character"s;
    case 3: return "invalid percent encoding"s;
    case 4: return "invalid scheme"s;
    case 5: return "invalid userinfo"s;
    case 6: return "invalid host"s;
    case 7: return "invalid port"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(uri_error_code e) -> std::error_code {
  static auto category = uri_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

#endif  // LIB_URI_HPP_
