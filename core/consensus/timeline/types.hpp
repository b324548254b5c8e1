/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "crypto/sr25519_types.hpp"

namespace lightbabe::consensus {

  /// slot number of the block production
  using SlotNumber = uint64_t;

  /// duration of single slot in milliseconds
  struct SlotDuration : public std::chrono::milliseconds {
    SlotDuration() = default;

    template <class Rep>
      requires std::is_integral_v<Rep>
    SlotDuration(Rep duration) : std::chrono::milliseconds(duration) {}

    auto operator<=>(const SlotDuration &r) const {
      return count() <=> r.count();
    }

    bool operator==(const SlotDuration &r) const {
      return count() == r.count();
    }

    friend ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const SlotDuration &duration) {
      return s << static_cast<uint64_t>(duration.count());
    }

    friend ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, SlotDuration &duration) {
      uint64_t v;
      s >> v;
      duration = {v};
      return s;
    }
  };

  /// number of the epoch in the block production
  using EpochNumber = uint64_t;

  /// number of slots in a single epoch
  using EpochLength = uint64_t;

  /// threshold, which must not be exceeded for the party to be a slot leader
  using Threshold = crypto::VRFThreshold;

  /// randomness, which is used in the VRF transcript
  using Randomness = common::Blob<crypto::constants::sr25519::vrf::OUTPUT_SIZE>;

  /// index of the authority in the epoch's authority list
  using AuthorityIndex = uint32_t;

}  // namespace lightbabe::consensus
