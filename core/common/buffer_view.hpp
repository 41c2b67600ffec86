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

namespace fragchain::common {

  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string_view toStringView() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    bool operator==(const BufferView &other) const {
      return std::equal(begin(), end(), other.begin(), other.end());
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

}  // namespace fragchain::common

namespace fragchain {
  using common::BufferView;
}  // namespace fragchain

template <>
struct fmt::formatter<fragchain::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const fragchain::common::BufferView &view,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    if (view.empty()) {
      return fmt::format_to(ctx.out(), "<empty>");
    }
    if (presentation == 's' && view.size() > 5) {
      return fmt::format_to(ctx.out(),
                            "0x{}…{}",
                            fragchain::common::hex_lower(view.first(2)),
                            fragchain::common::hex_lower(view.last(2)));
    }
    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
