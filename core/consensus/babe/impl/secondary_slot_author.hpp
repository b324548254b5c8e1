/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "consensus/timeline/types.hpp"
#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"

namespace lightbabe::consensus::babe {

  /**
   * Index of the authority expected to author secondary block in the slot:
   * blake2b_256(SCALE(randomness, slot)) as big-endian number modulo the
   * number of authorities
   * @return none if there are no authorities
   */
  outcome::result<std::optional<AuthorityIndex>> secondarySlotAuthor(
      SlotNumber slot,
      size_t authorities_count,
      const Randomness &randomness,
      const crypto::Hasher &hasher);

}  // namespace lightbabe::consensus::babe
