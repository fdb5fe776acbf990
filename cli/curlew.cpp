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

/* curlew: supervised file transfers with an external tool
 */

#include "command_config.hpp"
#include "command_fetch.hpp"
#include "command_probe.hpp"

#include "utilities.hpp"

#include <config.h>  // for VERSION

#include <algorithm>
#include <array>
#include <cstdlib>    // for EXIT_FAILURE, EXIT_SUCCESS
#include <exception>  // for std::set_terminate
#include <iostream>
#include <iterator>  // for std::cend
#include <print>
#include <ranges>
#include <string_view>

struct command_entry {
  std::string_view name;
  int (*main_fun)(int, char **);  // NOLINT(*-c-arrays)
  std::string_view about;
};

static constexpr auto commands = std::array{
  // clang-format off
  command_entry{"fetch", command_fetch_main, "download a file"},
  command_entry{"probe", command_probe_main, "print the response headers for a url"},
  command_entry{"config", command_config_main, "write a settings file"},
  // clang-format on
};

static auto
print_help(std::ostream &out, const std::string_view program) -> void {
  static constexpr auto sep_width = 4;
  const auto names = commands | std::views::transform(&command_entry::name);
  const auto cmds_line = join_with(names, ',');
  std::println(out, "usage: {} {{{}}}\n", program, cmds_line);
  std::println(out, "version: {}\n", VERSION);
  std::println(out, "commands:");
  const auto width =
    std::ranges::max(names | std::views::transform(&std::string_view::size));
  for (const auto &cmd : commands)
    std::println(out, "    {:{}}{}", cmd.name, width + sep_width, cmd.about);
}

int
main(int argc, char *argv[]) {  // NOLINT(*-c-arrays)
  static constexpr auto program = "curlew";

  std::set_terminate([]() {
    std::println(std::cerr, "Terminating due to critical error");
    std::abort();
  });

  if (argc <= 1) {
    print_help(std::cout, program);
    return EXIT_SUCCESS;
  }

  const std::string_view command = argv[1];
  if (command == "-h" || command == "--help") {
    print_help(std::cout, program);
    return EXIT_SUCCESS;
  }
  if (command == "--version") {
    std::println("{} {}", program, VERSION);
    return EXIT_SUCCESS;
  }

  const auto cmd_itr = std::ranges::find(commands, command, &command_entry::name);
  if (cmd_itr == std::cend(commands)) {
    std::println(std::cerr, "unknown command: {}\n", command);
    print_help(std::cerr, program);
    return EXIT_FAILURE;
  }

  return cmd_itr->main_fun(argc - 1, argv + 1);
}
