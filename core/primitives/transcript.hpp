/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>

#include <boost/endian/conversion.hpp>

#include "common/buffer.hpp"
#include "primitives/strobe.hpp"

namespace lightbabe::primitives {

  /**
   * Merlin transcript (https://merlin.cool) on top of STROBE-128. Used as the
   * VRF input of BABE slot claims. Integers are appended as 8 little-endian
   * bytes, message lengths as 4 little-endian bytes
   */
  class Transcript final {
   public:
    void initialize(common::BufferView label) {
      strobe_.initialize("Merlin v1.0"_bytes);
      append_message("dom-sep"_bytes, label);
    }

    void append_message(common::BufferView label, common::BufferView msg) {
      meta(label, msg.size());
      strobe_.ad<false>(msg);
    }

    void append_message(common::BufferView label, uint64_t value) {
      const uint64_t le = boost::endian::native_to_little(value);
      append_message(label,
                     {reinterpret_cast<const uint8_t *>(&le),  // NOLINT
                      sizeof(le)});
    }

    /// Fills \param dest with challenge bytes bound to everything appended
    /// so far and to \param label
    void challenge_bytes(common::BufferView label, std::span<uint8_t> dest) {
      meta(label, dest.size());
      strobe_.prf<false>(dest);
    }

    std::span<const uint8_t> data() const {
      return strobe_.data();
    }

    bool operator==(const Transcript &other) const {
      return std::ranges::equal(data(), other.data());
    }

   private:
    void meta(common::BufferView label, size_t length) {
      const uint32_t le =
          boost::endian::native_to_little(static_cast<uint32_t>(length));
      strobe_.metaAd<false>(label);
      strobe_.metaAd<true>(
          {reinterpret_cast<const uint8_t *>(&le), sizeof(le)});  // NOLINT
    }

    Strobe strobe_;
  };

}  // namespace lightbabe::primitives
