/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/header_verifier.hpp"

#include <memory>

#include "consensus/babe/types/babe_block_header.hpp"
#include "log/logger.hpp"

namespace lightbabe::crypto {
  class Hasher;
}  // namespace lightbabe::crypto

namespace lightbabe::consensus::babe {

  class SlotClaimValidator;

  struct HeaderInformation;

  class HeaderVerifierImpl : public HeaderVerifier {
   public:
    HeaderVerifierImpl(
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<SlotClaimValidator> slot_claim_validator);

    outcome::result<SuccessOrPending> startVerifyHeader(
        const VerifyConfig &config) const override;

   private:
    outcome::result<VerifySuccess> finishVerifyHeader(
        const VerifyConfig &config,
        const EpochInformation &epoch_info) const override;

    /// Epoch of the block and the announced information about the next one
    struct EpochTransition {
      EpochNumber epoch_number;
      std::optional<EpochInformation> epoch_change;
    };

    /**
     * Computes epochs of the block and its parent, and checks that the epoch
     * change log is present iff epochs differ
     */
    outcome::result<EpochTransition> checkEpochTransition(
        const VerifyConfig &config, const HeaderInformation &header_info) const;

    /// Checks slot order, seal and slot claim of already decoded header
    outcome::result<VerifySuccess> verifyWithEpoch(
        const VerifyConfig &config,
        const HeaderInformation &header_info,
        EpochTransition transition,
        const EpochInformation &epoch_info) const;

    /// Epoch of the parent block
    outcome::result<EpochNumber> parentEpochNumber(
        const VerifyConfig &config) const;

    /// blake2b-256 of the header without its seal
    outcome::result<primitives::BlockHash> preSealHash(
        const primitives::BlockHeader &header) const;

    log::Logger log_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<SlotClaimValidator> slot_claim_validator_;
  };

}  // namespace lightbabe::consensus::babe
