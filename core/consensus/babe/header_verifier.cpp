/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/header_verifier.hpp"

namespace lightbabe::consensus::babe {

  outcome::result<VerifySuccess> PendingVerify::finish(
      const EpochInformation &epoch_info) const {
    return verifier_.finishVerifyHeader(config_, epoch_info);
  }

}  // namespace lightbabe::consensus::babe
