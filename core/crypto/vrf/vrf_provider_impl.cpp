/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/vrf/vrf_provider_impl.hpp"

#include <algorithm>
#include <limits>

#include "common/int_serialization.hpp"

namespace lightbabe::crypto {

  namespace {
    using constants::sr25519::vrf::OUTPUT_SIZE;
    using constants::sr25519::vrf::PROOF_SIZE;

    // schnorrkel_crust takes the transcript as its raw strobe state
    const Strobe128 *strobeOf(const primitives::Transcript &msg) {
      return reinterpret_cast<const Strobe128 *>(  // NOLINT
          msg.data().data());
    }
  }  // namespace

  std::optional<VRFOutput> VRFProviderImpl::signTranscript(
      const primitives::Transcript &msg, const Sr25519Keypair &keypair) const {
    std::array<uint8_t, constants::sr25519::KEYPAIR_SIZE> secret{};
    auto it = std::ranges::copy(keypair.secret_key, secret.begin()).out;
    std::ranges::copy(keypair.public_key, it);

    // no threshold is applied when signing, so the limit is the maximum
    auto limit = common::uint128_to_le_bytes(
        std::numeric_limits<VRFThreshold>::max());

    std::array<uint8_t, OUTPUT_SIZE + PROOF_SIZE> output_and_proof{};
    auto res = sr25519_vrf_sign_transcript(output_and_proof.data(),
                                           secret.data(),
                                           strobeOf(msg),
                                           limit.data());
    std::ranges::fill(secret, 0);
    if (res.result != SR25519_SIGNATURE_RESULT_OK) {
      return std::nullopt;
    }

    VRFOutput out;
    std::span<const uint8_t> bytes{output_and_proof};
    std::ranges::copy(bytes.first<OUTPUT_SIZE>(), out.output.begin());
    std::ranges::copy(bytes.last<PROOF_SIZE>(), out.proof.begin());
    return out;
  }

  VRFVerifyOutput VRFProviderImpl::verifyTranscript(
      const primitives::Transcript &msg,
      const VRFOutput &output,
      const Sr25519PublicKey &public_key,
      const VRFThreshold &threshold) const {
    auto limit = common::uint128_to_le_bytes(threshold);
    auto res = sr25519_vrf_verify_transcript(public_key.data(),
                                             strobeOf(msg),
                                             output.output.data(),
                                             output.proof.data(),
                                             limit.data());
    return {.is_valid = res.result == SR25519_SIGNATURE_RESULT_OK,
            .is_less = res.is_less};
  }

}  // namespace lightbabe::crypto
