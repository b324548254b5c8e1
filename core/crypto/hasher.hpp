/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer.hpp"

namespace lightbabe::crypto {

  /**
   * Hashing of the chain: block hashes, pre-seal hashes and the secondary
   * slot author selection all use 32-byte blake2b
   */
  class Hasher {
   public:
    using Hash256 = common::Hash256;

    virtual ~Hasher() = default;

    virtual Hash256 blake2b_256(common::BufferView data) const = 0;
  };

}  // namespace lightbabe::crypto
