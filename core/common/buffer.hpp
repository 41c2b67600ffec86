/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <scale/scale.hpp>

#include "common/buffer_view.hpp"

namespace fragchain::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    Buffer(std::initializer_list<uint8_t> bytes) : Base(bytes) {}

    Buffer(Base &&other) : Base(std::move(other)) {}

    explicit Buffer(const Base &other) : Base(other) {}

    explicit Buffer(BufferView view) : Base(view.begin(), view.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    bool operator==(const Buffer &other) const {
      return static_cast<const Base &>(*this) == other;
    }

    BufferView view() const {
      return *this;
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Buffer &buffer) {
      return s << static_cast<const Base &>(buffer);
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Buffer &buffer) {
      return s >> static_cast<Base &>(buffer);
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << buffer.toHex();
  }

}  // namespace fragchain::common

namespace fragchain {
  using common::Buffer;
}  // namespace fragchain

template <>
struct fmt::formatter<fragchain::common::Buffer>
    : fmt::formatter<fragchain::common::BufferView> {
  template <typename FormatCtx>
  auto format(const fragchain::common::Buffer &buffer, FormatCtx &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<fragchain::common::BufferView>::format(buffer.view(),
                                                                 ctx);
  }
};
