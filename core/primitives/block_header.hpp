/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <span>

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "crypto/hasher.hpp"
#include "primitives/common.hpp"
#include "primitives/digest.hpp"

namespace lightbabe::primitives {
  /**
   * @struct BlockHeader represents header of a block
   */
  struct BlockHeader {
    BlockHash parent_hash{};              ///< Parent block hash
    BlockNumber number{};                 ///< Block number (height)
    common::Hash256 state_root{};         ///< Merkle tree root of state
    common::Hash256 extrinsics_root{};    ///< Hash of included extrinsics
    Digest digest{};                      ///< Chain-specific auxiliary data
    std::optional<BlockHash> hash_opt{};  ///< Block hash if calculated

    bool operator==(const BlockHeader &rhs) const {
      return std::tie(parent_hash, number, state_root, extrinsics_root, digest)
          == std::tie(rhs.parent_hash,
                      rhs.number,
                      rhs.state_root,
                      rhs.extrinsics_root,
                      rhs.digest);
    }

    bool operator!=(const BlockHeader &rhs) const {
      return !operator==(rhs);
    }

    const BlockHash &hash() const {
      BOOST_ASSERT_MSG(hash_opt.has_value(),
                       "Hash must be calculated and saved before that");
      return hash_opt.value();
    }
  };

  struct BlockHeaderReflection {
    const BlockHash &parent_hash;
    const BlockNumber &number;
    const common::Hash256 &state_root;
    const common::Hash256 &extrinsics_root;
    std::span<const DigestItem> digest;

    BlockHeaderReflection(const BlockHeader &origin)
        : parent_hash(origin.parent_hash),
          number(origin.number),
          state_root(origin.state_root),
          extrinsics_root(origin.extrinsics_root),
          digest(origin.digest) {}
  };

  // Reflection of block header without Seal, which is the last digest
  struct UnsealedBlockHeaderReflection : public BlockHeaderReflection {
    explicit UnsealedBlockHeaderReflection(const BlockHeaderReflection &origin)
        : BlockHeaderReflection(origin) {
      BOOST_ASSERT_MSG(not digest.empty()
                           and boost::get<Seal>(&digest.back()) != nullptr,
                       "Block must have Seal as the last digest");
      digest = digest.subspan(0, digest.size() - 1);
    }
    explicit UnsealedBlockHeaderReflection(const BlockHeader &origin)
        : UnsealedBlockHeaderReflection(BlockHeaderReflection(origin)) {}
  };

  ::scale::ScaleEncoderStream &operator<<(::scale::ScaleEncoderStream &s,
                                          const BlockHeaderReflection &bhr);

  /**
   * @brief outputs object of type BlockHeader to stream
   * @param s stream reference
   * @param bh value to output
   * @return reference to stream
   */
  ::scale::ScaleEncoderStream &operator<<(::scale::ScaleEncoderStream &s,
                                          const BlockHeader &bh);

  /**
   * @brief decodes object of type BlockHeader from stream
   * @param s stream reference
   * @param bh value to decode into
   * @return reference to stream
   */
  ::scale::ScaleDecoderStream &operator>>(::scale::ScaleDecoderStream &s,
                                          BlockHeader &bh);

  /// Saves blake2b-256 of the SCALE-encoded header into `hash_opt`
  outcome::result<void> calculateBlockHash(BlockHeader &header,
                                           const crypto::Hasher &hasher);

}  // namespace lightbabe::primitives
