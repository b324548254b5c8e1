/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"
#include "outcome/outcome.hpp"

namespace lightbabe::crypto {

  enum class Sr25519ProviderError {
    // produced signature does not verify with the public key of the keypair
    KEYPAIR_MISMATCH = 1,
    // signature could not be checked at all
    VERIFY_FAILED,
  };

  /**
   * Schnorr signatures over ristretto25519, used for block seals
   */
  class Sr25519Provider {
   public:
    virtual ~Sr25519Provider() = default;

    virtual Sr25519Keypair generateKeypair(const Sr25519Seed &seed) const = 0;

    virtual outcome::result<Sr25519Signature> sign(
        const Sr25519Keypair &keypair,
        std::span<const uint8_t> message) const = 0;

    /**
     * @return true if \param signature of \param message was made by the
     * owner of \param public_key, false if it was not
     */
    virtual outcome::result<bool> verify(
        const Sr25519Signature &signature,
        std::span<const uint8_t> message,
        const Sr25519PublicKey &public_key) const = 0;
  };

}  // namespace lightbabe::crypto

OUTCOME_HPP_DECLARE_ERROR(lightbabe::crypto, Sr25519ProviderError)
