/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/authority.hpp"
#include "consensus/timeline/types.hpp"

namespace lightbabe::consensus::babe {

  /// Information about the next epoch, announced in its first block
  struct NextEpochDescriptor {
    /// The authorities.
    Authorities authorities;

    /// The value of randomness to use for the slot-assignment.
    Randomness randomness;

    bool operator==(const NextEpochDescriptor &rhs) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const NextEpochDescriptor &ned) {
      return s << ned.authorities << ned.randomness;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, NextEpochDescriptor &ned) {
      return s >> ned.authorities >> ned.randomness;
    }
  };

}  // namespace lightbabe::consensus::babe
