/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_provider.hpp"

namespace lightbabe::crypto {

  class Sr25519ProviderImpl : public Sr25519Provider {
   public:
    ~Sr25519ProviderImpl() override = default;

    Sr25519Keypair generateKeypair(const Sr25519Seed &seed) const override;

    outcome::result<Sr25519Signature> sign(
        const Sr25519Keypair &keypair,
        std::span<const uint8_t> message) const override;

    outcome::result<bool> verify(
        const Sr25519Signature &signature,
        std::span<const uint8_t> message,
        const Sr25519PublicKey &public_key) const override;
  };

}  // namespace lightbabe::crypto
