/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/babe/slot_claim_validator.hpp"

#include <memory>

#include "log/logger.hpp"

namespace lightbabe::crypto {
  class Hasher;
  class Sr25519Provider;
  class VRFProvider;
}  // namespace lightbabe::crypto

namespace lightbabe::consensus::babe {

  class SlotClaimValidatorImpl : public SlotClaimValidator {
   public:
    SlotClaimValidatorImpl(
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<crypto::Sr25519Provider> sr25519_provider,
        std::shared_ptr<crypto::VRFProvider> vrf_provider);

    outcome::result<void> validateSlotClaim(
        const BabeBlockHeader &babe_header,
        const Seal &seal,
        const primitives::BlockHash &pre_seal_hash,
        EpochNumber epoch_number,
        const EpochInformation &epoch_info,
        const EpochConfiguration &config) const override;

   private:
    /**
     * Verifies that the seal was produced by the author over pre-seal hash
     */
    bool verifySignature(const primitives::BlockHash &pre_seal_hash,
                         const Seal &seal,
                         const AuthorityId &public_key) const;

    /**
     * Verifies VRF output of the block
     * @param check_threshold if output must be less than threshold
     */
    bool verifyVRF(const BabeBlockHeader &babe_header,
                   EpochNumber epoch_number,
                   const AuthorityId &public_key,
                   const Threshold &threshold,
                   const Randomness &randomness,
                   bool check_threshold) const;

    /**
     * Checks that the author is the one assigned to the secondary slot
     */
    outcome::result<bool> verifySecondarySlotAuthor(
        const BabeBlockHeader &babe_header,
        const EpochInformation &epoch_info) const;

    log::Logger log_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
    std::shared_ptr<crypto::VRFProvider> vrf_provider_;
  };

}  // namespace lightbabe::consensus::babe
