/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/types/babe_block_header.hpp"
#include "consensus/babe/types/epoch_information.hpp"
#include "consensus/babe/types/seal.hpp"
#include "outcome/outcome.hpp"
#include "primitives/common.hpp"

namespace lightbabe::consensus::babe {

  enum class SlotClaimError {
    NO_VALIDATOR = 1,
    INVALID_VRF,
    INVALID_SECONDARY_SLOT_AUTHOR,
    SECONDARY_SLOT_ASSIGNMENTS_DISABLED,
    INVALID_SIGNATURE,
  };

  /**
   * Checks that the author of the block had the right to produce it in the
   * claimed slot, and that the block is signed by that author
   */
  class SlotClaimValidator {
   public:
    virtual ~SlotClaimValidator() = default;

    /**
     * @param babe_header slot claim of the block
     * @param seal signature of the block
     * @param pre_seal_hash hash of the block header without seal
     * @param epoch_number epoch of the block
     * @param epoch_info authorities and randomness of that epoch
     * @param config leadership rate and allowed slots of that epoch
     */
    virtual outcome::result<void> validateSlotClaim(
        const BabeBlockHeader &babe_header,
        const Seal &seal,
        const primitives::BlockHash &pre_seal_hash,
        EpochNumber epoch_number,
        const EpochInformation &epoch_info,
        const EpochConfiguration &config) const = 0;
  };

}  // namespace lightbabe::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(lightbabe::consensus::babe, SlotClaimError)
