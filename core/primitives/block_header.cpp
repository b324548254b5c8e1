/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/block_header.hpp"

namespace lightbabe::primitives {

  ::scale::ScaleEncoderStream &operator<<(::scale::ScaleEncoderStream &s,
                                          const BlockHeaderReflection &bhr) {
    s << bhr.parent_hash << ::scale::CompactInteger(bhr.number)
      << bhr.state_root << bhr.extrinsics_root;
    s << ::scale::CompactInteger(bhr.digest.size());
    for (const auto &item : bhr.digest) {
      s << item;
    }
    return s;
  }

  ::scale::ScaleEncoderStream &operator<<(::scale::ScaleEncoderStream &s,
                                          const BlockHeader &bh) {
    return s << BlockHeaderReflection(bh);
  }

  ::scale::ScaleDecoderStream &operator>>(::scale::ScaleDecoderStream &s,
                                          BlockHeader &bh) {
    ::scale::CompactInteger number_compact;
    s >> bh.parent_hash >> number_compact >> bh.state_root >> bh.extrinsics_root
        >> bh.digest;
    bh.number = number_compact.convert_to<BlockNumber>();
    bh.hash_opt.reset();
    return s;
  }

  outcome::result<void> calculateBlockHash(BlockHeader &header,
                                           const crypto::Hasher &hasher) {
    OUTCOME_TRY(encoded, ::scale::encode(header));
    header.hash_opt = hasher.blake2b_256(encoded);
    return outcome::success();
  }

}  // namespace lightbabe::primitives
