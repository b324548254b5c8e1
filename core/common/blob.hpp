/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <ostream>
#include <span>

#include <fmt/format.h>
#include <scale/scale.hpp>

#include "common/hexutil.hpp"

/**
 * Declares a distinct fixed-size byte type `space_name::class_name` on top of
 * Blob<blob_size>, so that e.g. a public key can not be passed where a
 * signature is expected. The new type keeps scale encoding and formatting of
 * the underlying blob
 */
#define LIGHTBABE_BLOB_STRICT_TYPEDEF(space_name, class_name, blob_size)      \
  namespace space_name {                                                      \
    struct class_name : public ::lightbabe::common::Blob<blob_size> {         \
      using Base = ::lightbabe::common::Blob<blob_size>;                      \
      using Base::Base;                                                       \
                                                                              \
      class_name() = default;                                                 \
      explicit class_name(const Base &blob) : Base{blob} {}                   \
                                                                              \
      static ::outcome::result<class_name> fromHex(std::string_view hex) {    \
        OUTCOME_TRY(blob, Base::fromHex(hex));                                \
        return class_name{blob};                                              \
      }                                                                       \
                                                                              \
      static ::outcome::result<class_name> fromSpan(                          \
          std::span<const uint8_t> bytes) {                                   \
        OUTCOME_TRY(blob, Base::fromSpan(bytes));                             \
        return class_name{blob};                                              \
      }                                                                       \
                                                                              \
      friend ::scale::ScaleEncoderStream &operator<<(                         \
          ::scale::ScaleEncoderStream &s, const class_name &v) {              \
        return s << static_cast<const Base &>(v);                             \
      }                                                                       \
      friend ::scale::ScaleDecoderStream &operator>>(                         \
          ::scale::ScaleDecoderStream &s, class_name &v) {                    \
        return s >> static_cast<Base &>(v);                                   \
      }                                                                       \
    };                                                                        \
  }                                                                           \
                                                                              \
  template <>                                                                 \
  struct fmt::formatter<space_name::class_name>                               \
      : fmt::formatter<space_name::class_name::Base> {}

namespace lightbabe::common {

  enum class BlobError { INCORRECT_LENGTH = 1 };

  using byte_t = uint8_t;

  /**
   * Byte array of compile-time size: hashes, keys, signatures, VRF outputs and
   * engine ids. Scale encodes it without a length prefix
   */
  template <size_t size_>
  class Blob : public std::array<byte_t, size_> {
    using Array = std::array<byte_t, size_>;

   public:
    // scale-codec encodes such collections without a length prefix
    static constexpr bool is_static_collection = true;

    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &bytes) : Array{bytes} {}

    static constexpr size_t size() {
      return size_;
    }

    std::string toHex() const {
      return hex_lower({this->data(), size_});
    }

    /**
     * @return blob made of exactly size() bytes, INCORRECT_LENGTH otherwise
     */
    static outcome::result<Blob> fromSpan(std::span<const uint8_t> bytes) {
      if (bytes.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }
      Blob blob;
      std::copy(bytes.begin(), bytes.end(), blob.begin());
      return blob;
    }

    static outcome::result<Blob> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }

    /// Same as fromHex, but "0x" prefix is mandatory
    static outcome::result<Blob> fromHexWithPrefix(std::string_view hex) {
      OUTCOME_TRY(bytes, unhexWith0x(hex));
      return fromSpan(bytes);
    }
  };

  extern template class Blob<32ul>;

  using Hash256 = Blob<32>;

  template <size_t N>
  std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace lightbabe::common

namespace lightbabe {
  using common::Hash256;
}  // namespace lightbabe

/**
 * Blob is printed as "0x" followed by hex. Blobs longer than 4 bytes are
 * abbreviated to the first and last two bytes unless "{:l}" is requested
 */
template <size_t N>
struct fmt::formatter<lightbabe::common::Blob<N>> {
  bool full = N <= 4;

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() and (*it == 's' or *it == 'l')) {
      full = *it++ == 'l';
    }
    if (it != ctx.end() and *it != '}') {
      throw format_error("invalid format of blob");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const lightbabe::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (full) {
      return fmt::format_to(ctx.out(), "0x{}", blob.toHex());
    }
    return fmt::format_to(ctx.out(),
                          "0x{:02x}{:02x}…{:02x}{:02x}",
                          blob[0],
                          blob[1],
                          blob[N - 2],
                          blob[N - 1]);
  }
};

OUTCOME_HPP_DECLARE_ERROR(lightbabe::common, BlobError);
