/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <blake2.h>

namespace lightbabe::crypto {

  HasherImpl::Hash256 HasherImpl::blake2b_256(common::BufferView data) const {
    Hash256 out;
    blake2b_state state;
    blake2b_init(&state, out.size());
    blake2b_update(&state, data.data(), data.size());
    blake2b_final(&state, out.data(), out.size());
    return out;
  }

}  // namespace lightbabe::crypto
