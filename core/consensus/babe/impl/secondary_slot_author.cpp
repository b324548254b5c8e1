/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/secondary_slot_author.hpp"

#include <scale/scale.hpp>

#include "common/int_serialization.hpp"

namespace lightbabe::consensus::babe {

  outcome::result<std::optional<AuthorityIndex>> secondarySlotAuthor(
      SlotNumber slot,
      size_t authorities_count,
      const Randomness &randomness,
      const crypto::Hasher &hasher) {
    if (authorities_count == 0) {
      return std::nullopt;
    }

    OUTCOME_TRY(encoded, scale::encode(randomness, slot));
    auto rand = common::be_bytes_to_uint256(hasher.blake2b_256(encoded));
    common::uint256_t index = rand % authorities_count;
    return std::optional<AuthorityIndex>{index.convert_to<AuthorityIndex>()};
  }

}  // namespace lightbabe::consensus::babe
