/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/vrf_provider.hpp"

namespace lightbabe::crypto {

  class VRFProviderImpl : public VRFProvider {
   public:
    ~VRFProviderImpl() override = default;

    std::optional<VRFOutput> signTranscript(
        const primitives::Transcript &msg,
        const Sr25519Keypair &keypair) const override;

    VRFVerifyOutput verifyTranscript(
        const primitives::Transcript &msg,
        const VRFOutput &output,
        const Sr25519PublicKey &public_key,
        const VRFThreshold &threshold) const override;
  };

}  // namespace lightbabe::crypto
