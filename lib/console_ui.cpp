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

#include "console_ui.hpp"

#include <indicators/cursor_control.hpp>

#include <iostream>
#include <string_view>

namespace curlew {

console_ui::console_ui() { indicators::show_console_cursor(false); }

console_ui::~console_ui() {
  indicators::show_console_cursor(true);
  std::cout.flush();
}

auto
console_ui::clear_line() -> void {
  indicators::erase_line();
  std::cout.flush();
}

auto
console_ui::render_detail(const std::string_view text,
                          const bool new_line) -> void {
  std::cout << text;
  if (new_line)
    std::cout << '\n';
  std::cout.flush();
}

}  // namespace curlew
