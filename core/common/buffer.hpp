/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <scale/scale.hpp>

#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

inline auto operator""_bytes(const char *s, std::size_t size) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(s), size);
}

namespace lightbabe::common {

  using BufferView = std::span<const uint8_t>;

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    Buffer(Base &&other) : Base(std::move(other)) {}
    explicit Buffer(const Base &other) : Base(other) {}

    explicit Buffer(BufferView view) : Base(view.begin(), view.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    using Base::Base;
    using Base::operator=;

    /**
     * @brief Put bytes into this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(BufferView view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    BufferView view() const {
      return *this;
    }

    BufferView view(size_t offset, size_t length) const {
      return view().subspan(offset, length);
    }

    /**
     * @brief encode bytearray as hex
     * @return hex-encoded string
     */
    std::string toHex() const {
      return hex_lower(view());
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

}  // namespace lightbabe::common

template <>
struct fmt::formatter<lightbabe::common::Buffer> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const lightbabe::common::Buffer &buffer, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "0x{}", buffer.toHex());
  }
};
