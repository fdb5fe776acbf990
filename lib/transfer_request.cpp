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

#include "transfer_request.hpp"

#include "uri.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace curlew {

[[nodiscard]] auto
extract_credentials(const std::string &source,
                    std::string &auth) -> std::string {
  std::error_code error;
  auto u = parse_uri(source, error);
  // not every source the tool accepts is a URI
  if (error || !u.is_http() || u.userinfo.empty())
    return source;
  if (auth.empty())
    auth = u.userinfo;
  u.userinfo.clear();
  return u.to_string();
}

transfer_request::transfer_request(const std::string &source,
                                   const std::string &destination,
                                   transport_config config) :
  // config.auth is filled before config is moved into place
  source{extract_credentials(source, config.auth)}, destination{destination},
  config{std::move(config)} {}

}  // namespace curlew
