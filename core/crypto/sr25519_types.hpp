/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}
#include <boost/multiprecision/cpp_int.hpp>

#include "common/blob.hpp"

namespace lightbabe::crypto {
  namespace constants::sr25519 {
    // sizes in bytes, as schnorrkel_crust defines them
    enum {
      KEYPAIR_SIZE = SR25519_KEYPAIR_SIZE,
      SECRET_SIZE = SR25519_SECRET_SIZE,
      PUBLIC_SIZE = SR25519_PUBLIC_SIZE,
      SIGNATURE_SIZE = SR25519_SIGNATURE_SIZE,
      SEED_SIZE = SR25519_SEED_SIZE
    };

    namespace vrf {
      enum {
        PROOF_SIZE = SR25519_VRF_PROOF_SIZE,
        OUTPUT_SIZE = SR25519_VRF_OUTPUT_SIZE
      };
    }  // namespace vrf

  }  // namespace constants::sr25519

  using VRFPreOutput =
      std::array<uint8_t, constants::sr25519::vrf::OUTPUT_SIZE>;
  using VRFThreshold = boost::multiprecision::uint128_t;
  using VRFProof = std::array<uint8_t, constants::sr25519::vrf::PROOF_SIZE>;

  /**
   * VRF pre-output together with the DLEQ proof that it was derived from the
   * transcript by the owner of the key. Encoded as 32 + 64 bytes
   */
  struct VRFOutput {
    VRFPreOutput output{};
    VRFProof proof{};

    bool operator==(const VRFOutput &other) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const VRFOutput &v) {
      return s << v.output << v.proof;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, VRFOutput &v) {
      return s >> v.output >> v.proof;
    }
  };

  struct VRFVerifyOutput {
    bool is_valid;  ///< proof matches the public key and the transcript
    bool is_less;   ///< derived value is below the threshold
  };
}  // namespace lightbabe::crypto

LIGHTBABE_BLOB_STRICT_TYPEDEF(lightbabe::crypto,
                              Sr25519SecretKey,
                              constants::sr25519::SECRET_SIZE);
LIGHTBABE_BLOB_STRICT_TYPEDEF(lightbabe::crypto,
                              Sr25519PublicKey,
                              constants::sr25519::PUBLIC_SIZE);
LIGHTBABE_BLOB_STRICT_TYPEDEF(lightbabe::crypto,
                              Sr25519Signature,
                              constants::sr25519::SIGNATURE_SIZE);
LIGHTBABE_BLOB_STRICT_TYPEDEF(lightbabe::crypto,
                              Sr25519Seed,
                              constants::sr25519::SEED_SIZE);

namespace lightbabe::crypto {
  struct Sr25519Keypair {
    Sr25519SecretKey secret_key;
    Sr25519PublicKey public_key;

    bool operator==(const Sr25519Keypair &other) const = default;
  };
}  // namespace lightbabe::crypto
