/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/babe/types/babe_block_header.hpp"
#include "consensus/babe/types/consensus_log.hpp"
#include "consensus/babe/types/seal.hpp"
#include "consensus/timeline/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace lightbabe::consensus::babe {

  enum class DigestError {
    REQUIRED_DIGESTS_NOT_FOUND = 1,
    NO_TRAILING_SEAL_DIGEST,
    GENESIS_BLOCK_CAN_NOT_HAVE_DIGESTS,
  };

  /// BABE-related content of a block header
  struct HeaderInformation {
    /// slot claim of the block
    BabeBlockHeader babe_header;

    /// announced authorities and randomness of the next epoch
    std::optional<NextEpochDescriptor> epoch_change;

    /// announced configuration of the next epoch
    std::optional<NextConfigDataV1> config_change;

    /// signature of the author
    Seal seal;
  };

  outcome::result<SlotNumber> getBabeSlot(
      const primitives::BlockHeader &header);

  /**
   * Looks for the BABE pre-runtime digest among all digests except the last
   * one (which is the seal)
   */
  outcome::result<BabeBlockHeader> getBabeBlockHeader(
      const primitives::BlockHeader &block_header);

  /// Decodes the trailing seal digest
  outcome::result<Seal> getSeal(const primitives::BlockHeader &block_header);

  /// @returns NextEpochData consensus log of BABE if the header has it
  outcome::result<std::optional<NextEpochDescriptor>> getNextEpochDigest(
      const primitives::BlockHeader &block_header);

  /// @returns NextConfigData consensus log of BABE if the header has it
  outcome::result<std::optional<NextConfigDataV1>> getNextConfigDigest(
      const primitives::BlockHeader &block_header);

  outcome::result<HeaderInformation> extractHeaderInformation(
      const primitives::BlockHeader &block_header);

}  // namespace lightbabe::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(lightbabe::consensus::babe, DigestError)
