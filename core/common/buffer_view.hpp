/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <ostream>
#include <span>
#include <string_view>

#include <fmt/format.h>

#include "common/hexutil.hpp"

namespace foxchain::common {

  /**
   * Non-owning view over a contiguous sequence of bytes
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    template <typename T>
    decltype(auto) operator=(T &&t) {
      return span::operator=(std::forward<T>(t));
    }

    void dropFirst(size_t count) {
      *this = subspan(count);
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    bool operator==(const BufferView &other) const {
      return std::ranges::equal(*this, other);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }
}  // namespace foxchain::common

namespace foxchain {
  using common::BufferView;
}  // namespace foxchain

template <>
struct fmt::formatter<foxchain::common::BufferView> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const foxchain::common::BufferView &view, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (view.empty()) {
      static constexpr string_view message("<empty>");
      return std::copy(std::begin(message), std::end(message), ctx.out());
    }
    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
