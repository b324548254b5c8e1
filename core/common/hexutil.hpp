/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace lightbabe::common {

  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
  };

  /// Lowercase hex of \param bytes, without prefix
  std::string hex_lower(std::span<const uint8_t> bytes);

  std::string hex_lower_0x(std::span<const uint8_t> bytes);

  /**
   * Decodes hex of any letter case
   * @return NOT_ENOUGH_INPUT for odd length, NON_HEX_INPUT for other symbols
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /// Same as unhex, but \param hex must start with "0x"
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace lightbabe::common

OUTCOME_HPP_DECLARE_ERROR(lightbabe::common, UnhexError);
