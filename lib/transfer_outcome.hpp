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

#ifndef LIB_TRANSFER_OUTCOME_HPP_
#define LIB_TRANSFER_OUTCOME_HPP_

#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>  // for std::true_type
#include <utility>      // for std::to_underlying, std::unreachable

/// @brief Enum for error codes related to transfers that ran to completion
enum class transfer_error_code : std::uint8_t {
  ok = 0,
  cancelled = 1,
  tool_failed = 2,
};

template <>
struct std::is_error_code_enum<transfer_error_code> : public std::true_type {};

struct transfer_error_category : std::error_category {
  // clang-format off
  auto name() const noexcept -> const char * override {return "transfer";}
  auto message(int code) const -> std::string override {
    using std::string_literals::operator""s;
    switch (code) {
    case 0: return "ok"s;
    case 1: return "transfer cancelled"s;
    case 2: return "transfer tool reported an error"s;
    }
    std::unreachable();
  }
  // clang-format on
};

inline auto
make_error_code(transfer_error_code e) -> std::error_code {
  static auto category = transfer_error_category{};
  return std::error_code(std::to_underlying(e), category);
}

namespace curlew {

using std::literals::string_view_literals::operator""sv;

enum class outcome_status_t : std::uint8_t {
  success,
  cancelled,
  tool_error,
};

static constexpr auto outcome_status_name = std::array{
  // clang-format off
  "success"sv,
  "cancelled"sv,
  "tool_error"sv,
  // clang-format on
};

/// Result of one fetch or probe. The message is only meaningful for
/// tool errors and may be empty even then.
struct transfer_outcome {
  outcome_status_t status{outcome_status_t::success};
  std::string message;

  [[nodiscard]] static auto
  success() -> transfer_outcome {
    return {outcome_status_t::success, {}};
  }

  [[nodiscard]] static auto
  cancelled() -> transfer_outcome {
    return {outcome_status_t::cancelled, {}};
  }

  [[nodiscard]] static auto
  tool_error(std::string message) -> transfer_outcome {
    return {outcome_status_t::tool_error, std::move(message)};
  }

  [[nodiscard]] auto
  is_success() const noexcept -> bool {
    return status == outcome_status_t::success;
  }

  [[nodiscard]] auto
  to_error_code() const noexcept -> std::error_code {
    switch (status) {
    case outcome_status_t::success:
      return transfer_error_code::ok;
    case outcome_status_t::cancelled:
      return transfer_error_code::cancelled;
    case outcome_status_t::tool_error:
      return transfer_error_code::tool_failed;
    }
    std::unreachable();
  }

  auto
  operator==(const transfer_outcome &) const -> bool = default;
};

}  // namespace curlew

template <>
struct std::formatter<curlew::outcome_status_t> : std::formatter<std::string> {
  auto
  format(const curlew::outcome_status_t &s, std::format_context &ctx) const {
    const auto idx = std::to_underlying(s);
    return std::format_to(ctx.out(), "{}", curlew::outcome_status_name[idx]);
  }
};

template <>
struct std::formatter<curlew::transfer_outcome> : std::formatter<std::string> {
  auto
  format(const curlew::transfer_outcome &o, std::format_context &ctx) const {
    if (o.message.empty())
      return std::format_to(ctx.out(), "{}", o.status);
    return std::format_to(ctx.out(), "{}: {}", o.status, o.message);
  }
};

#endif  // LIB_TRANSFER_OUTCOME_HPP_
