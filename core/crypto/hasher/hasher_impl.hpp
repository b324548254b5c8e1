/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace lightbabe::crypto {

  /// Hasher backed by libb2
  class HasherImpl final : public Hasher {
   public:
    Hash256 blake2b_256(common::BufferView data) const override;
  };

}  // namespace lightbabe::crypto
