/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "outcome/outcome.hpp"

namespace lightbabe {

  enum class UnusedError : uint8_t {
    AttemptToEncodeUnused = 1,
    AttemptToDecodeUnused,
  };

  /**
   * Placeholder alternative of a variant, keeps indices of the following
   * alternatives aligned with their wire discriminants. Neither encodes nor
   * decodes
   */
  template <size_t N>
  struct Unused {
    bool operator==(const Unused &) const = default;
  };

  template <size_t N>
  [[noreturn]] ::scale::ScaleEncoderStream &operator<<(
      ::scale::ScaleEncoderStream &, const Unused<N> &) {
    ::scale::raise(UnusedError::AttemptToEncodeUnused);
  }

  template <size_t N>
  [[noreturn]] ::scale::ScaleDecoderStream &operator>>(
      ::scale::ScaleDecoderStream &, Unused<N> &) {
    ::scale::raise(UnusedError::AttemptToDecodeUnused);
  }

}  // namespace lightbabe

OUTCOME_HPP_DECLARE_ERROR(lightbabe, UnusedError);
