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

#include "uri.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>  // for std::size
#include <ranges>
#include <string>
#include <string_view>
#include <system_error>

namespace curlew {

// RFC 3986 character classes
[[nodiscard]] static constexpr auto
is_unreserved(const char c) noexcept -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '.' ||
         c == '_' || c == '~';
}

[[nodiscard]] static constexpr auto
is_sub_delim(const char c) noexcept -> bool {
  static constexpr std::string_view sub_delims = "!$&'()*+,;=";
  return sub_delims.find(c) != std::string_view::npos;
}

[[nodiscard]] static constexpr auto
is_gen_delim(const char c) noexcept -> bool {
  static constexpr std::string_view gen_delims = ":/?#[]@";
  return gen_delims.find(c) != std::string_view::npos;
}

[[nodiscard]] static auto
is_hex(const char c) noexcept -> bool {
  return std::isxdigit(static_cast<unsigned char>(c));
}

/// Every character must be allowed somewhere in a URI and every '%' must
/// start a valid percent-encoded octet.
[[nodiscard]] static auto
check_characters(const std::string_view s) noexcept -> std::error_code {
  for (std::size_t i = 0; i < std::size(s); ++i) {
    const auto c = s[i];
    if (c == '%') {
      if (i + 2 >= std::size(s) || !is_hex(s[i + 1]) || !is_hex(s[i + 2]))
        return uri_error_code::invalid_percent_encoding;
      i += 2;
    }
    else if (!is_unreserved(c) && !is_sub_delim(c) && !is_gen_delim(c))
      return uri_error_code::invalid_character;
  }
  return {};
}

// userinfo, reg-name and path/query characters, gen-delims aside
[[nodiscard]] static auto
all_of_class(const std::string_view s, const std::string_view extra) noexcept
  -> bool {
  return std::ranges::all_of(s, [&](const char c) {
    return is_unreserved(c) || is_sub_delim(c) || c == '%' ||
           extra.find(c) != std::string_view::npos;
  });
}

[[nodiscard]] static auto
is_valid_scheme(const std::string_view s) noexcept -> bool {
  if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
    return false;
  return std::ranges::all_of(s, [](const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
           c == '-' || c == '.';
  });
}

/// Split 'host[:port]' where host may be an IP-literal in brackets
[[nodiscard]] static auto
parse_host_port(const std::string_view hp, uri &u) noexcept -> std::error_code {
  std::string_view host = hp;
  std::string_view port{};
  if (!hp.empty() && hp[0] == '[') {
    const auto close = hp.find(']');
    if (close == std::string_view::npos)
      return uri_error_code::invalid_host;
    host = hp.substr(0, close + 1);
    const auto rest = hp.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':')
        return uri_error_code::invalid_host;
      port = rest.substr(1);
    }
    const auto inside = host.substr(1, std::size(host) - 2);
    if (inside.empty() || !all_of_class(inside, ":"))
      return uri_error_code::invalid_host;
  }
  else {
    const auto colon = hp.rfind(':');
    if (colon != std::string_view::npos) {
      host = hp.substr(0, colon);
      port = hp.substr(colon + 1);
    }
    if (!all_of_class(host, ""))
      return uri_error_code::invalid_host;
  }
  if (!std::ranges::all_of(port, [](const unsigned char c) {
        return std::isdigit(c);
      }))
    return uri_error_code::invalid_port;
  u.host = host;
  u.port = port;
  return {};
}

[[nodiscard]] auto
parse_uri(const std::string_view s, std::error_code &error) noexcept -> uri {
  if (s.empty()) {
    error = uri_error_code::empty_uri;
    return {};
  }
  error = check_characters(s);
  if (error)
    return {};

  uri u;
  std::string_view rest = s;

  // fragment and query come off the end first; '#' cannot appear
  // anywhere else and '?' cannot appear before the path
  if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
    u.fragment = rest.substr(hash + 1);
    u.has_fragment = true;
    rest = rest.substr(0, hash);
  }
  if (const auto qmark = rest.find('?'); qmark != std::string_view::npos) {
    u.query = rest.substr(qmark + 1);
    u.has_query = true;
    rest = rest.substr(0, qmark);
  }
  if (!all_of_class(u.fragment, ":@/?") || !all_of_class(u.query, ":@/?")) {
    error = uri_error_code::invalid_character;
    return {};
  }

  // scheme: only if a ':' appears before the first '/'
  const auto colon = rest.find(':');
  if (colon != std::string_view::npos && colon < rest.find('/')) {
    const auto scheme = rest.substr(0, colon);
    if (!is_valid_scheme(scheme)) {
      error = uri_error_code::invalid_scheme;
      return {};
    }
    u.scheme.resize(std::size(scheme));
    std::ranges::transform(scheme, std::begin(u.scheme), [](const char c) {
      return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    rest = rest.substr(colon + 1);
  }

  if (rest.starts_with("//")) {
    u.has_authority = true;
    rest = rest.substr(2);
    const auto auth_end = std::min(rest.find('/'), std::size(rest));
    auto authority = rest.substr(0, auth_end);
    rest = rest.substr(auth_end);
    if (const auto at = authority.find('@'); at != std::string_view::npos) {
      u.userinfo = authority.substr(0, at);
      if (!all_of_class(u.userinfo, ":")) {
        error = uri_error_code::invalid_userinfo;
        return {};
      }
      authority = authority.substr(at + 1);
    }
    error = parse_host_port(authority, u);
    if (error)
      return {};
  }

  if (!all_of_class(rest, ":@/")) {
    error = uri_error_code::invalid_character;
    return {};
  }
  u.path = rest;
  return u;
}

[[nodiscard]] auto
uri::to_string() const -> std::string {
  std::string r;
  if (!scheme.empty())
    r += scheme + ':';
  if (has_authority) {
    r += "//";
    if (!userinfo.empty())
      r += userinfo + '@';
    r += host;
    if (!port.empty())
      r += ':' + port;
  }
  r += path;
  if (has_query)
    r += '?' + query;
  if (has_fragment)
    r += '#' + fragment;
  return r;
}

}  // namespace curlew
