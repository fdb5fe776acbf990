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

#ifndef LIB_CONSOLE_UI_HPP_
#define LIB_CONSOLE_UI_HPP_

#include "transfer_ui.hpp"

#include <string_view>

namespace curlew {

/// Progress on the terminal. The cursor is hidden while an instance
/// exists, so progress lines overwrite each other cleanly.
class console_ui : public transfer_ui {
public:
  console_ui();
  ~console_ui() override;

  console_ui(const console_ui &) = delete;
  auto
  operator=(const console_ui &) -> console_ui & = delete;

  auto
  clear_line() -> void override;

  auto
  render_detail(const std::string_view text, const bool new_line)
    -> void override;
};

}  // namespace curlew

#endif  // LIB_CONSOLE_UI_HPP_
