/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace lightbabe::consensus::babe {

  enum class VerifyError {
    SLOT_NUMBER_NOT_INCREASING = 1,
    UNEXPECTED_EPOCH_CHANGE_LOG,
    MISSING_EPOCH_CHANGE_LOG,
    MISSING_BLOCK1_SLOT_NUMBER,
    BAD_PARENT_HEADER,
  };

}  // namespace lightbabe::consensus::babe

OUTCOME_HPP_DECLARE_ERROR(lightbabe::consensus::babe, VerifyError)
