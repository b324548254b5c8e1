/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sr25519/sr25519_provider_impl.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY(lightbabe::crypto, Sr25519ProviderError, e) {
  using E = lightbabe::crypto::Sr25519ProviderError;
  switch (e) {
    case E::KEYPAIR_MISMATCH:
      return "Secret key of keypair does not match its public key";
    case E::VERIFY_FAILED:
      return "Sr25519 signature could not be verified";
  }
  return "Unknown Sr25519ProviderError";
}

namespace lightbabe::crypto {

  Sr25519Keypair Sr25519ProviderImpl::generateKeypair(
      const Sr25519Seed &seed) const {
    // schnorrkel lays the keypair out as secret key followed by public key
    std::array<uint8_t, constants::sr25519::KEYPAIR_SIZE> bytes{};
    sr25519_keypair_from_seed(bytes.data(), seed.data());

    std::span<const uint8_t> view{bytes};
    Sr25519Keypair keypair;
    keypair.secret_key =
        Sr25519SecretKey::fromSpan(view.first<Sr25519SecretKey::size()>())
            .value();
    keypair.public_key =
        Sr25519PublicKey::fromSpan(view.last<Sr25519PublicKey::size()>())
            .value();
    std::ranges::fill(bytes, 0);
    return keypair;
  }

  outcome::result<Sr25519Signature> Sr25519ProviderImpl::sign(
      const Sr25519Keypair &keypair, std::span<const uint8_t> message) const {
    Sr25519Signature signature;
    sr25519_sign(signature.data(),
                 keypair.public_key.data(),
                 keypair.secret_key.data(),
                 message.data(),
                 message.size());

    OUTCOME_TRY(valid, verify(signature, message, keypair.public_key));
    if (not valid) {
      return Sr25519ProviderError::KEYPAIR_MISMATCH;
    }
    return signature;
  }

  outcome::result<bool> Sr25519ProviderImpl::verify(
      const Sr25519Signature &signature,
      std::span<const uint8_t> message,
      const Sr25519PublicKey &public_key) const {
    return sr25519_verify(
        signature.data(), message.data(), message.size(), public_key.data());
  }

}  // namespace lightbabe::crypto
