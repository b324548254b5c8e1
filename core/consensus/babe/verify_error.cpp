/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/verify_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lightbabe::consensus::babe, VerifyError, e) {
  using E = lightbabe::consensus::babe::VerifyError;
  switch (e) {
    case E::SLOT_NUMBER_NOT_INCREASING:
      return "slot number of the block is not greater than parent's one";
    case E::UNEXPECTED_EPOCH_CHANGE_LOG:
      return "block has epoch change log, but epoch is not changed";
    case E::MISSING_EPOCH_CHANGE_LOG:
      return "block starts new epoch, but has no epoch change log";
    case E::MISSING_BLOCK1_SLOT_NUMBER:
      return "slot number of block #1 is required to verify the block";
    case E::BAD_PARENT_HEADER:
      return "BABE digests of the parent block can not be extracted";
  }
  return "unknown error (lightbabe::consensus::babe::VerifyError)";
}
