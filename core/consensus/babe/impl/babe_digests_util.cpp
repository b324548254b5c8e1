/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/babe_digests_util.hpp"

#include <scale/scale.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(lightbabe::consensus::babe, DigestError, e) {
  using E = lightbabe::consensus::babe::DigestError;
  switch (e) {
    case E::REQUIRED_DIGESTS_NOT_FOUND:
      return "the block must contain at least BABE "
             "header and seal digests";
    case E::NO_TRAILING_SEAL_DIGEST:
      return "the block must contain a seal digest as the last digest";
    case E::GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS:
      return "genesis block can not have digests";
  }
  return "unknown error (lightbabe::consensus::babe::DigestError)";
}

namespace lightbabe::consensus::babe {

  namespace {
    outcome::result<std::span<const primitives::DigestItem>> unsealedDigests(
        const primitives::BlockHeader &block_header) {
      [[unlikely]] if (block_header.number == 0) {
        return DigestError::GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS;
      }

      if (block_header.digest.empty()) {
        return DigestError::REQUIRED_DIGESTS_NOT_FOUND;
      }
      const auto &digests = block_header.digest;
      return std::span(digests).subspan(0, digests.size() - 1);
    }

    /// Decodes all BABE consensus logs of the header
    outcome::result<std::vector<ConsensusLog>> getBabeConsensusLogs(
        const primitives::BlockHeader &block_header) {
      OUTCOME_TRY(digests, unsealedDigests(block_header));

      std::vector<ConsensusLog> logs;
      for (const auto &digest : digests) {
        const auto *consensus = boost::get<primitives::Consensus>(&digest);
        if (consensus == nullptr
            or consensus->consensus_engine_id != primitives::kBabeEngineId) {
          continue;
        }
        OUTCOME_TRY(log, scale::decode<ConsensusLog>(consensus->data.view()));
        logs.emplace_back(std::move(log));
      }
      return logs;
    }
  }  // namespace

  outcome::result<SlotNumber> getBabeSlot(
      const primitives::BlockHeader &header) {
    OUTCOME_TRY(babe_block_header, getBabeBlockHeader(header));
    return babe_block_header.slot_number;
  }

  outcome::result<BabeBlockHeader> getBabeBlockHeader(
      const primitives::BlockHeader &block_header) {
    OUTCOME_TRY(digests, unsealedDigests(block_header));

    for (const auto &digest : digests) {
      const auto *pre_runtime = boost::get<primitives::PreRuntime>(&digest);
      if (pre_runtime != nullptr
          and pre_runtime->consensus_engine_id == primitives::kBabeEngineId) {
        OUTCOME_TRY(babe_block_header,
                    scale::decode<BabeBlockHeader>(pre_runtime->data.view()));
        return babe_block_header;
      }
    }

    return DigestError::REQUIRED_DIGESTS_NOT_FOUND;
  }

  outcome::result<Seal> getSeal(const primitives::BlockHeader &block_header) {
    [[unlikely]] if (block_header.number == 0) {
      return DigestError::GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS;
    }

    if (block_header.digest.empty()) {
      return DigestError::REQUIRED_DIGESTS_NOT_FOUND;
    }
    const auto &digests = block_header.digest;

    // last digest of the block must be a seal - signature
    const auto *seal = boost::get<primitives::Seal>(&digests.back());
    if (seal == nullptr
        or seal->consensus_engine_id != primitives::kBabeEngineId) {
      return DigestError::NO_TRAILING_SEAL_DIGEST;
    }

    OUTCOME_TRY(seal_digest, scale::decode<Seal>(seal->data.view()));

    return seal_digest;
  }

  outcome::result<std::optional<NextEpochDescriptor>> getNextEpochDigest(
      const primitives::BlockHeader &block_header) {
    OUTCOME_TRY(logs, getBabeConsensusLogs(block_header));
    for (auto &log : logs) {
      if (auto *descriptor = boost::get<NextEpochDescriptor>(&log)) {
        return std::move(*descriptor);
      }
    }
    return std::nullopt;
  }

  outcome::result<std::optional<NextConfigDataV1>> getNextConfigDigest(
      const primitives::BlockHeader &block_header) {
    OUTCOME_TRY(logs, getBabeConsensusLogs(block_header));
    for (auto &log : logs) {
      if (auto *config = boost::get<NextConfigDataV1>(&log)) {
        return *config;
      }
    }
    return std::nullopt;
  }

  outcome::result<HeaderInformation> extractHeaderInformation(
      const primitives::BlockHeader &block_header) {
    OUTCOME_TRY(babe_header, getBabeBlockHeader(block_header));
    OUTCOME_TRY(seal, getSeal(block_header));
    OUTCOME_TRY(epoch_change, getNextEpochDigest(block_header));
    OUTCOME_TRY(config_change, getNextConfigDigest(block_header));
    return HeaderInformation{
        .babe_header = babe_header,
        .epoch_change = std::move(epoch_change),
        .config_change = config_change,
        .seal = seal,
    };
  }

}  // namespace lightbabe::consensus::babe
