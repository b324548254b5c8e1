/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(lightbabe::common, BlobError, e) {
  using E = lightbabe::common::BlobError;
  switch (e) {
    case E::INCORRECT_LENGTH:
      return "Byte sequence length differs from the blob size";
  }
  return "Unknown BlobError";
}

namespace lightbabe::common {

  // block hashes
  template class Blob<32ul>;

}  // namespace lightbabe::common
