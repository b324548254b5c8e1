/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/babe_util.hpp"

#include <limits>

#include "consensus/babe/verify_error.hpp"
#include "primitives/arithmetic_error.hpp"

namespace lightbabe::consensus::babe {

  outcome::result<EpochNumber> slotNumberToEpoch(
      SlotNumber slot_number,
      const BabeConfiguration &genesis_config,
      SlotNumber block1_slot_number) {
    if (slot_number < block1_slot_number) {
      return primitives::ArithmeticError::Underflow;
    }
    auto slots_since_block1 = slot_number - block1_slot_number;
    if (slots_since_block1 == std::numeric_limits<SlotNumber>::max()) {
      return primitives::ArithmeticError::Overflow;
    }
    if (genesis_config.slotsPerEpoch() == 0) {
      return primitives::ArithmeticError::DivisionByZero;
    }
    return (slots_since_block1 + 1) / genesis_config.slotsPerEpoch();
  }

  outcome::result<EpochNumber> blockEpochNumber(
      primitives::BlockNumber block_number,
      SlotNumber slot_number,
      const BabeConfiguration &genesis_config,
      std::optional<SlotNumber> block1_slot_number) {
    if (block_number <= 1) {
      return EpochNumber{0};
    }
    if (not block1_slot_number.has_value()) {
      return VerifyError::MISSING_BLOCK1_SLOT_NUMBER;
    }
    return slotNumberToEpoch(
        slot_number, genesis_config, block1_slot_number.value());
  }

}  // namespace lightbabe::consensus::babe
