/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/slot_claim_validator_impl.hpp"

#include <boost/assert.hpp>

#include "consensus/babe/impl/prepare_transcript.hpp"
#include "consensus/babe/impl/secondary_slot_author.hpp"
#include "consensus/babe/impl/threshold_util.hpp"
#include "crypto/hasher.hpp"
#include "crypto/sr25519_provider.hpp"
#include "crypto/vrf_provider.hpp"
#include "primitives/transcript.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lightbabe::consensus::babe, SlotClaimError, e) {
  using E = lightbabe::consensus::babe::SlotClaimError;
  switch (e) {
    case E::NO_VALIDATOR:
      return "author of block is not active validator";
    case E::INVALID_VRF:
      return "VRF value and output are invalid";
    case E::INVALID_SECONDARY_SLOT_AUTHOR:
      return "author of block is not assigned to the secondary slot";
    case E::SECONDARY_SLOT_ASSIGNMENTS_DISABLED:
      return "Secondary slot assignments are disabled for the current epoch.";
    case E::INVALID_SIGNATURE:
      return "SR25519 signature, which is in BABE header, is invalid";
  }
  return "unknown error (lightbabe::consensus::babe::SlotClaimError)";
}

namespace lightbabe::consensus::babe {

  SlotClaimValidatorImpl::SlotClaimValidatorImpl(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider,
      std::shared_ptr<crypto::VRFProvider> vrf_provider)
      : log_(log::createLogger("SlotClaimValidator", "slot_claim_validator")),
        hasher_(std::move(hasher)),
        sr25519_provider_(std::move(sr25519_provider)),
        vrf_provider_(std::move(vrf_provider)) {
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(sr25519_provider_);
    BOOST_ASSERT(vrf_provider_);
  }

  outcome::result<void> SlotClaimValidatorImpl::validateSlotClaim(
      const BabeBlockHeader &babe_header,
      const Seal &seal,
      const primitives::BlockHash &pre_seal_hash,
      EpochNumber epoch_number,
      const EpochInformation &epoch_info,
      const EpochConfiguration &config) const {
    if (babe_header.authority_index >= epoch_info.authorities.size()) {
      SL_VERBOSE(log_,
                 "Claim of slot {} is invalid because validator index {} out "
                 "of bound ({} authorities)",
                 babe_header.slot_number,
                 babe_header.authority_index,
                 epoch_info.authorities.size());
      return SlotClaimError::NO_VALIDATOR;
    }

    const auto &authority_id =
        epoch_info.authorities[babe_header.authority_index].id;

    SL_DEBUG(log_,
             "Validating claim of slot {} (epoch {}) by authority #{} {}",
             babe_header.slot_number,
             epoch_number,
             babe_header.authority_index,
             authority_id);

    // @see
    // https://github.com/paritytech/substrate/blob/polkadot-v0.9.8/client/consensus/babe/src/verification.rs#L111

    if (babe_header.isProducedInSecondarySlot()) {
      bool plainAndAllowed =
          config.allowed_slots == AllowedSlots::PrimaryAndSecondaryPlain
          and babe_header.slotType() == SlotType::SecondaryPlain;
      bool vrfAndAllowed =
          config.allowed_slots == AllowedSlots::PrimaryAndSecondaryVRF
          and babe_header.slotType() == SlotType::SecondaryVRF;
      if (not plainAndAllowed and not vrfAndAllowed) {
        SL_WARN(log_,
                "Block of slot {} produced in {} slot, but current "
                "configuration allows only {}",
                babe_header.slot_number,
                to_string(babe_header.slotType()),
                to_string(config.allowed_slots));
        return SlotClaimError::SECONDARY_SLOT_ASSIGNMENTS_DISABLED;
      }

      OUTCOME_TRY(is_author,
                  verifySecondarySlotAuthor(babe_header, epoch_info));
      if (not is_author) {
        return SlotClaimError::INVALID_SECONDARY_SLOT_AUTHOR;
      }
    }

    // VRF must prove that the peer is the leader of the slot
    if (babe_header.needVRFCheck()) {
      auto threshold =
          babe_header.needVRFWithThresholdCheck()
              ? calculateThreshold(config.leadership_rate,
                                   epoch_info.authorities,
                                   babe_header.authority_index)
              : Threshold{0};
      if (not verifyVRF(babe_header,
                        epoch_number,
                        authority_id,
                        threshold,
                        epoch_info.randomness,
                        babe_header.needVRFWithThresholdCheck())) {
        return SlotClaimError::INVALID_VRF;
      }
    }

    // signature in seal of the header must be valid
    if (not verifySignature(pre_seal_hash, seal, authority_id)) {
      return SlotClaimError::INVALID_SIGNATURE;
    }

    return outcome::success();
  }

  bool SlotClaimValidatorImpl::verifySignature(
      const primitives::BlockHash &pre_seal_hash,
      const Seal &seal,
      const AuthorityId &public_key) const {
    auto res =
        sr25519_provider_->verify(seal.signature, pre_seal_hash, public_key);
    if (res.has_error()) {
      SL_WARN(log_,
              "Seal signature can not be verified: {}",
              res.error().message());
      return false;
    }
    if (not res.value()) {
      SL_VERBOSE(log_,
                 "Seal signature of block {} is not valid",
                 pre_seal_hash);
      return false;
    }
    return true;
  }

  bool SlotClaimValidatorImpl::verifyVRF(const BabeBlockHeader &babe_header,
                                         const EpochNumber epoch_number,
                                         const AuthorityId &public_key,
                                         const Threshold &threshold,
                                         const Randomness &randomness,
                                         const bool check_threshold) const {
    primitives::Transcript transcript;
    prepareTranscript(
        transcript, randomness, babe_header.slot_number, epoch_number);
    SL_TRACE(log_,
             "prepareTranscript (verifyVRF): randomness {}, slot {}, epoch {}",
             randomness,
             babe_header.slot_number,
             epoch_number);

    auto verify_res = vrf_provider_->verifyTranscript(
        transcript, babe_header.vrf_output, public_key, threshold);
    if (not verify_res.is_valid) {
      SL_VERBOSE(log_,
                 "VRF proof in block of slot {} is not valid",
                 babe_header.slot_number);
      return false;
    }

    // verify threshold
    if (check_threshold and not verify_res.is_less) {
      SL_VERBOSE(log_,
                 "VRF value in block of slot {} is not less than the "
                 "threshold",
                 babe_header.slot_number);
      return false;
    }

    return true;
  }

  outcome::result<bool> SlotClaimValidatorImpl::verifySecondarySlotAuthor(
      const BabeBlockHeader &babe_header,
      const EpochInformation &epoch_info) const {
    OUTCOME_TRY(expected,
                secondarySlotAuthor(babe_header.slot_number,
                                    epoch_info.authorities.size(),
                                    epoch_info.randomness,
                                    *hasher_));
    if (not expected.has_value()
        or expected.value() != babe_header.authority_index) {
      SL_VERBOSE(log_,
                 "Authority #{} is not the author of secondary slot {}",
                 babe_header.authority_index,
                 babe_header.slot_number);
      return false;
    }
    return true;
  }

}  // namespace lightbabe::consensus::babe
