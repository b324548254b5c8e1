/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/header_verifier_impl.hpp"

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "consensus/babe/babe_util.hpp"
#include "consensus/babe/impl/babe_digests_util.hpp"
#include "consensus/babe/slot_claim_validator.hpp"
#include "crypto/hasher.hpp"

namespace lightbabe::consensus::babe {

  HeaderVerifierImpl::HeaderVerifierImpl(
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<SlotClaimValidator> slot_claim_validator)
      : log_(log::createLogger("HeaderVerifier", "header_verifier")),
        hasher_(std::move(hasher)),
        slot_claim_validator_(std::move(slot_claim_validator)) {
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(slot_claim_validator_);
  }

  outcome::result<SuccessOrPending> HeaderVerifierImpl::startVerifyHeader(
      const VerifyConfig &config) const {
    OUTCOME_TRY(header_info, extractHeaderInformation(config.header));
    const auto &babe_header = header_info.babe_header;

    OUTCOME_TRY(transition, checkEpochTransition(config, header_info));

    SL_VERBOSE(log_,
               "Verifying header of block #{} ({} in slot {}, epoch {}, "
               "authority #{})",
               config.header.number,
               to_string(babe_header.slotType()),
               babe_header.slot_number,
               transition.epoch_number,
               babe_header.authority_index);

    // authorities and randomness of epochs 0 and 1 come from genesis
    if (transition.epoch_number <= 1) {
      const auto &genesis = config.genesis_configuration;
      EpochInformation genesis_epoch{
          .authorities = genesis.authorities,
          .randomness = genesis.randomness,
          .configuration = std::nullopt,
      };
      OUTCOME_TRY(success,
                  verifyWithEpoch(
                      config, header_info, std::move(transition), genesis_epoch));
      return SuccessOrPending{std::move(success)};
    }

    SL_DEBUG(log_,
             "Block #{} needs information about epoch {}",
             config.header.number,
             transition.epoch_number);
    return SuccessOrPending{
        PendingVerify{config, transition.epoch_number, *this}};
  }

  outcome::result<VerifySuccess> HeaderVerifierImpl::finishVerifyHeader(
      const VerifyConfig &config, const EpochInformation &epoch_info) const {
    OUTCOME_TRY(header_info, extractHeaderInformation(config.header));
    OUTCOME_TRY(transition, checkEpochTransition(config, header_info));
    return verifyWithEpoch(
        config, header_info, std::move(transition), epoch_info);
  }

  outcome::result<VerifySuccess> HeaderVerifierImpl::verifyWithEpoch(
      const VerifyConfig &config,
      const HeaderInformation &header_info,
      EpochTransition transition,
      const EpochInformation &epoch_info) const {
    const auto &babe_header = header_info.babe_header;

    // genesis block has no slot
    if (config.parent_header.number != 0) {
      auto parent_slot_res = getBabeSlot(config.parent_header);
      if (parent_slot_res.has_error()) {
        SL_WARN(log_,
                "Parent of block #{} is malformed: {}",
                config.header.number,
                parent_slot_res.error().message());
        return VerifyError::BAD_PARENT_HEADER;
      }
      if (babe_header.slot_number <= parent_slot_res.value()) {
        SL_VERBOSE(log_,
                   "Slot {} of block #{} is not greater than parent's slot {}",
                   babe_header.slot_number,
                   config.header.number,
                   parent_slot_res.value());
        return VerifyError::SLOT_NUMBER_NOT_INCREASING;
      }
    }

    OUTCOME_TRY(pre_seal_hash, preSealHash(config.header));

    const auto &genesis = config.genesis_configuration;
    auto epoch_config = epoch_info.configuration.value_or(EpochConfiguration{
        .leadership_rate = genesis.leadership_rate,
        .allowed_slots = genesis.allowed_slots,
    });

    OUTCOME_TRY(slot_claim_validator_->validateSlotClaim(babe_header,
                                                         header_info.seal,
                                                         pre_seal_hash,
                                                         transition.epoch_number,
                                                         epoch_info,
                                                         epoch_config));

    SL_DEBUG(log_,
             "Header of block #{} in slot {} is valid",
             config.header.number,
             babe_header.slot_number);

    return VerifySuccess{
        .epoch_change = std::move(transition.epoch_change),
        .slot_number = babe_header.slot_number,
        .is_primary = babe_header.slotType() == SlotType::Primary,
    };
  }

  outcome::result<HeaderVerifierImpl::EpochTransition>
  HeaderVerifierImpl::checkEpochTransition(
      const VerifyConfig &config, const HeaderInformation &header_info) const {
    OUTCOME_TRY(epoch_number,
                blockEpochNumber(config.header.number,
                                 header_info.babe_header.slot_number,
                                 config.genesis_configuration,
                                 config.block1_slot_number));
    OUTCOME_TRY(parent_epoch_number, parentEpochNumber(config));

    const auto &next_epoch = header_info.epoch_change;
    const auto &next_config = header_info.config_change;

    std::optional<EpochInformation> epoch_change;
    if (next_epoch.has_value()) {
      epoch_change = EpochInformation{
          .authorities = next_epoch->authorities,
          .randomness = next_epoch->randomness,
          .configuration = std::nullopt,
      };
      if (next_config.has_value()) {
        epoch_change->configuration = EpochConfiguration{
            .leadership_rate = next_config->leadership_rate,
            .allowed_slots = next_config->allowed_slots,
        };
      }
    } else if (next_config.has_value()) {
      SL_WARN(log_,
              "Block #{} has config change log without epoch change log; "
              "it is ignored",
              config.header.number);
    }

    // genesis and block #1 are both in epoch 0, so block #1 has no log
    bool epoch_changed = epoch_number != parent_epoch_number;
    if (epoch_change.has_value() and not epoch_changed) {
      SL_VERBOSE(log_,
                 "Block #{} of epoch {} has unexpected epoch change log",
                 config.header.number,
                 epoch_number);
      return VerifyError::UNEXPECTED_EPOCH_CHANGE_LOG;
    }
    if (not epoch_change.has_value() and epoch_changed) {
      SL_VERBOSE(log_,
                 "Block #{} starts epoch {} (parent's epoch {}), but has no "
                 "epoch change log",
                 config.header.number,
                 epoch_number,
                 parent_epoch_number);
      return VerifyError::MISSING_EPOCH_CHANGE_LOG;
    }

    return EpochTransition{
        .epoch_number = epoch_number,
        .epoch_change = std::move(epoch_change),
    };
  }

  outcome::result<EpochNumber> HeaderVerifierImpl::parentEpochNumber(
      const VerifyConfig &config) const {
    const auto &parent = config.parent_header;
    if (parent.number <= 1) {
      return EpochNumber{0};
    }

    auto parent_babe_header = getBabeBlockHeader(parent);
    if (parent_babe_header.has_error()) {
      SL_WARN(log_,
              "Parent #{} of block #{} is malformed: {}",
              parent.number,
              config.header.number,
              parent_babe_header.error().message());
      return VerifyError::BAD_PARENT_HEADER;
    }

    return blockEpochNumber(parent.number,
                            parent_babe_header.value().slot_number,
                            config.genesis_configuration,
                            config.block1_slot_number);
  }

  outcome::result<primitives::BlockHash> HeaderVerifierImpl::preSealHash(
      const primitives::BlockHeader &header) const {
    primitives::UnsealedBlockHeaderReflection unsealed_header(header);
    OUTCOME_TRY(encoded, scale::encode(unsealed_header));
    return hasher_->blake2b_256(encoded);
  }

}  // namespace lightbabe::consensus::babe
