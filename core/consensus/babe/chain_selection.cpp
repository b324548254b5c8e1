/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/chain_selection.hpp"

#include <numeric>

namespace lightbabe::consensus::babe {

  ChainPreference compareBestBlocks(const BestBlockCandidate &first,
                                    const BestBlockCandidate &second) {
    if (first.slot_number != second.slot_number) {
      return first.slot_number > second.slot_number ? ChainPreference::FIRST
                                                    : ChainPreference::SECOND;
    }
    if (first.primary_slots_count != second.primary_slots_count) {
      return first.primary_slots_count > second.primary_slots_count
               ? ChainPreference::FIRST
               : ChainPreference::SECOND;
    }
    return ChainPreference::UNDECIDED;
  }

  BestBlockCandidate extendCandidate(const BestBlockCandidate &candidate,
                                     const AncestorInfo &block) {
    return BestBlockCandidate{
        .slot_number = block.slot_number,
        .primary_slots_count =
            candidate.primary_slots_count + (block.is_primary ? 1 : 0),
    };
  }

  BestBlockCandidate foldAncestry(std::span<const AncestorInfo> ancestry) {
    return std::accumulate(
        ancestry.begin(), ancestry.end(), BestBlockCandidate{}, extendCandidate);
  }

}  // namespace lightbabe::consensus::babe
