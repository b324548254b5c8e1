/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/babe/types/babe_configuration.hpp"

namespace lightbabe::consensus::babe {

  /// Parameters of the epoch which may be changed by NextConfigData
  struct EpochConfiguration {
    LeadershipRate leadership_rate;
    AllowedSlots allowed_slots{};

    bool operator==(const EpochConfiguration &other) const = default;
  };

  /**
   * Everything needed to validate slot claims of an epoch. Learned by the
   * caller from the epoch change digest of the previous epoch's first block
   */
  struct EpochInformation {
    /// Ordered authorities, `authority_index` of pre-digest points here
    Authorities authorities;

    /// Randomness of the epoch
    Randomness randomness;

    /// Overrides genesis `c` and allowed slots, when set
    std::optional<EpochConfiguration> configuration;

    bool operator==(const EpochInformation &other) const = default;
  };

}  // namespace lightbabe::consensus::babe
