/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/babe/types/babe_configuration.hpp"
#include "consensus/timeline/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace lightbabe::consensus::babe {

  /**
   * Epoch of the slot, counting from the slot of block #1:
   * (slot_number - block1_slot_number + 1) / slots_per_epoch
   */
  outcome::result<EpochNumber> slotNumberToEpoch(
      SlotNumber slot_number,
      const BabeConfiguration &genesis_config,
      SlotNumber block1_slot_number);

  /**
   * Epoch of the block. Genesis and block #1 always belong to epoch 0, so
   * `block1_slot_number` is needed only for later blocks
   */
  outcome::result<EpochNumber> blockEpochNumber(
      primitives::BlockNumber block_number,
      SlotNumber slot_number,
      const BabeConfiguration &genesis_config,
      std::optional<SlotNumber> block1_slot_number);

}  // namespace lightbabe::consensus::babe
