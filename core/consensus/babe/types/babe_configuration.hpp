/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "consensus/babe/types/authority.hpp"
#include "consensus/timeline/types.hpp"

namespace lightbabe::consensus::babe {

  enum class AllowedSlots : uint8_t {
    PrimaryOnly,
    PrimaryAndSecondaryPlain,
    PrimaryAndSecondaryVRF
  };

  inline std::string_view to_string(AllowedSlots s) {
    switch (s) {
      case AllowedSlots::PrimaryOnly:
        return "Primary only";
      case AllowedSlots::PrimaryAndSecondaryPlain:
        return "Primary and Secondary Plain";
      case AllowedSlots::PrimaryAndSecondaryVRF:
        return "Primary and Secondary VRF";
    }
    return "Unknown";
  }

  inline ::scale::ScaleEncoderStream &operator<<(::scale::ScaleEncoderStream &s,
                                                 const AllowedSlots &v) {
    return s << static_cast<uint8_t>(v);
  }

  inline ::scale::ScaleDecoderStream &operator>>(::scale::ScaleDecoderStream &s,
                                                 AllowedSlots &v) {
    uint8_t value{};
    s >> value;
    if (value > static_cast<uint8_t>(AllowedSlots::PrimaryAndSecondaryVRF)) {
      ::scale::raise(::scale::DecodeError::UNEXPECTED_VALUE);
    }
    v = static_cast<AllowedSlots>(value);
    return s;
  }

  /// Numerator and denominator of the `c` constant
  using LeadershipRate = std::pair<uint64_t, uint64_t>;

  /// Configuration data used by the BABE consensus engine.
  /// Field order matches the `BabeApi_configuration` runtime response.
  struct BabeConfiguration {
    /// The slot duration in milliseconds for BABE. Currently, only
    /// the value provided by this type at genesis will be used.
    SlotDuration slot_duration{};  // must be permanent

    /// Number of slots in an epoch
    EpochLength epoch_length{};  // must be permanent

    /// A constant value that is used in the threshold calculation formula.
    /// Expressed as a rational where the first member of the tuple is the
    /// numerator and the second is the denominator. The rational should
    /// represent a value between 0 and 1.
    /// In substrate it is called `c`
    /// In the threshold formula calculation, `1 - leadership_rate` represents
    /// the probability of a slot being empty.
    LeadershipRate leadership_rate;  // changes by NextConfigData

    /// The authorities of epochs 0 and 1
    Authorities authorities;

    /// The randomness of epochs 0 and 1
    Randomness randomness;

    /// Type of allowed slots.
    AllowedSlots allowed_slots{};  // can be changed by NextConfigData

    EpochLength slotsPerEpoch() const {
      return epoch_length;
    }

    bool operator==(const BabeConfiguration &other) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const BabeConfiguration &config) {
      return s << config.slot_duration << config.epoch_length
               << config.leadership_rate << config.authorities
               << config.randomness << config.allowed_slots;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, BabeConfiguration &config) {
      return s >> config.slot_duration >> config.epoch_length
          >> config.leadership_rate >> config.authorities >> config.randomness
          >> config.allowed_slots;
    }
  };

}  // namespace lightbabe::consensus::babe
