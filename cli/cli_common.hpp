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

#ifndef CLI_CLI_COMMON_HPP_
#define CLI_CLI_COMMON_HPP_

#include "environment_utilities.hpp"
#include "logger.hpp"
#include "transfer_settings.hpp"
#include "transport_config.hpp"

#include <CLI/CLI.hpp>

#include <cstdint>
#include <filesystem>
#include <iterator>  // for std::istream_iterator
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

static const int column_width_default = 30;

// exit status when a transfer is interrupted, as for a shell on SIGINT
static const int exit_cancelled = 130;

class curlew_formatter : public CLI::Formatter {
public:
  auto
  make_option_desc(const CLI::Option *opt) const -> std::string override {
    static constexpr auto max_descr_width = 50;
    std::istringstream iss{opt->get_description()};
    const std::vector<std::string> words{
      std::istream_iterator<std::string>{iss}, {}};
    if (words.empty())
      return {};
    std::string r{words[0]};
    std::uint32_t width = std::size(words[0]);
    for (auto i = 1u; i < std::size(words); ++i) {
      if (width == 0 || width + std::size(words[i]) < max_descr_width) {
        r += ' ';
        ++width;
      }
      else {
        r += '\n';
        width = 0;
      }
      r += words[i];
      width += std::size(words[i]);
    }
    return r;
  }
};

/// Options shared by commands that run a transfer
inline auto
add_transport_options(CLI::App &app, curlew::transport_config &config) -> void {
  // clang-format off
  app.add_option("--auth", config.auth,
                 "credentials as user[:password]; taken from the url if not given");
  app.add_option("--cacert", config.ca_cert, "CA certificate file");
  app.add_option("--capath", config.ca_path, "directory of CA certificates");
  app.add_option("--cert", config.client_cert, "client certificate file");
  app.add_option("-H,--header", config.headers,
                 "extra request header; may be repeated")
    ->allow_extra_args(false);
  app.add_flag("--resume", config.resume,
               "continue a partial download of the output file")
    ->option_text(" ");
  app.add_flag("--insecure", config.insecure,
               "do not verify the server certificate")
    ->option_text(" ");
  // clang-format on
}

/// Settings from the named file, or from the default file if it exists.
/// Only a file named on the command line must exist.
[[nodiscard]] inline auto
load_settings(const std::string &config_file,
              std::error_code &error) -> curlew::transfer_settings {
  auto &lgr = curlew::logger::instance();
  std::string filename{config_file};
  if (filename.empty()) {
    std::error_code default_error;
    filename = curlew::get_default_config_file(default_error);
    if (default_error) {
      lgr.debug("No default settings file: {}", default_error);
      return {};
    }
    const bool file_exists = std::filesystem::exists(filename, default_error);
    if (default_error || !file_exists) {
      lgr.debug("No settings file at {}", filename);
      return {};
    }
  }
  lgr.debug("Reading settings file: {}", filename);
  return curlew::transfer_settings::read(filename, error);
}

#endif  // CLI_CLI_COMMON_HPP_
