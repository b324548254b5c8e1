/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>

#include "consensus/timeline/types.hpp"

namespace lightbabe::consensus::babe {

  /// Tip of a chain competing to become the best one
  struct BestBlockCandidate {
    /// slot of the tip
    SlotNumber slot_number{};

    /// number of blocks produced in primary slots since the fork point
    uint64_t primary_slots_count{};

    bool operator==(const BestBlockCandidate &other) const = default;
  };

  /// Block of a chain, as needed to choose the best chain
  struct AncestorInfo {
    SlotNumber slot_number{};
    bool is_primary{};
  };

  enum class ChainPreference : uint8_t {
    FIRST,
    SECOND,
    /// left to the caller, e.g. the first seen wins
    UNDECIDED,
  };

  /**
   * Compares tips of chains having the same fork point. Higher slot wins, on
   * equal slots the chain with more primary blocks wins
   */
  ChainPreference compareBestBlocks(const BestBlockCandidate &first,
                                    const BestBlockCandidate &second);

  /// Appends the block to the chain of the candidate
  BestBlockCandidate extendCandidate(const BestBlockCandidate &candidate,
                                     const AncestorInfo &block);

  /**
   * Builds candidate from the blocks after the fork point, ordered from the
   * oldest to the tip
   */
  BestBlockCandidate foldAncestry(std::span<const AncestorInfo> ancestry);

}  // namespace lightbabe::consensus::babe
