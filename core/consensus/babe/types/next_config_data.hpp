/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/babe_configuration.hpp"

namespace lightbabe::consensus::babe {

  /// Configuration of the epoch after next, announced together with
  /// NextEpochDescriptor. Only version 1 of the descriptor exists.
  struct NextConfigDataV1 {
    static constexpr uint8_t kVersion = 1;

    LeadershipRate leadership_rate;
    AllowedSlots allowed_slots{};

    bool operator==(const NextConfigDataV1 &other) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const NextConfigDataV1 &config) {
      return s << kVersion << config.leadership_rate << config.allowed_slots;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, NextConfigDataV1 &config) {
      uint8_t version{};
      s >> version;
      if (version != kVersion) {
        ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
      }
      return s >> config.leadership_rate >> config.allowed_slots;
    }
  };

}  // namespace lightbabe::consensus::babe
