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

#ifndef LIB_TRANSFER_REQUEST_HPP_
#define LIB_TRANSFER_REQUEST_HPP_

#include "transport_config.hpp"

#include <format>
#include <string>
#include <utility>  // for std::move

namespace curlew {

/// Credentials embedded in an http-family source URL are moved into
/// 'auth' (unless 'auth' is already set) and removed from the returned
/// source. Sources that do not parse as a URI are returned unchanged.
[[nodiscard]] auto
extract_credentials(const std::string &source,
                    std::string &auth) -> std::string;

struct transfer_request {
  const std::string source;
  const std::string destination;
  const transport_config config;

  transfer_request(const std::string &source, const std::string &destination,
                   transport_config config = {});

  // header probes have no destination
  explicit transfer_request(const std::string &source,
                            transport_config config = {}) :
    transfer_request(source, std::string{}, std::move(config)) {}
};

}  // namespace curlew

template <>
struct std::formatter<curlew::transfer_request> : std::formatter<std::string> {
  auto
  format(const curlew::transfer_request &r, std::format_context &ctx) const {
    return std::format_to(ctx.out(), "{} -> {}", r.source, r.destination);
  }
};

#endif  // LIB_TRANSFER_REQUEST_HPP_
