/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "crypto/sr25519_types.hpp"
#include "primitives/transcript.hpp"

namespace lightbabe::crypto {

  /**
   * Schnorrkel VRF over a Merlin transcript
   */
  class VRFProvider {
   public:
    virtual ~VRFProvider() = default;

    /**
     * Evaluates VRF of \param keypair on \param msg and proves the result
     * @return none if the backend refused the keypair
     */
    virtual std::optional<VRFOutput> signTranscript(
        const primitives::Transcript &msg,
        const Sr25519Keypair &keypair) const = 0;

    /**
     * Checks \param output against \param public_key and \param msg, and
     * compares the value derived from it with \param threshold. Both flags
     * are reported, callers decide which of them matter
     */
    virtual VRFVerifyOutput verifyTranscript(
        const primitives::Transcript &msg,
        const VRFOutput &output,
        const Sr25519PublicKey &public_key,
        const VRFThreshold &threshold) const = 0;
  };

}  // namespace lightbabe::crypto
