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

#ifndef LIB_RESULT_CLASSIFIER_HPP_
#define LIB_RESULT_CLASSIFIER_HPP_

#include "invocation_runner.hpp"
#include "transfer_outcome.hpp"

#include <string>
#include <string_view>

namespace curlew {

/// The tool's own description of its failure: the text following the
/// first 'curl: (N)' marker in stderr, less one trailing line end. Empty
/// if there is no marker.
[[nodiscard]] auto
extract_tool_message(const std::string_view stderr_data) -> std::string;

/// Cancellation takes precedence over the exit code
[[nodiscard]] auto
classify(const invocation_result &result) -> transfer_outcome;

}  // namespace curlew

#endif  // LIB_RESULT_CLASSIFIER_HPP_
