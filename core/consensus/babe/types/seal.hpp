/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"

namespace lightbabe::consensus::babe {
  /**
   * Basically a signature of the block's header
   */
  struct Seal {
    /// Sig_sr25519(Blake2b(unsealed_block_header))
    crypto::Sr25519Signature signature;

    bool operator==(const Seal &other) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Seal &seal) {
      return s << seal.signature;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Seal &seal) {
      return s >> seal.signature;
    }
  };
}  // namespace lightbabe::consensus::babe
