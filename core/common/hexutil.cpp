/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(lightbabe::common, UnhexError, e) {
  using E = lightbabe::common::UnhexError;
  switch (e) {
    case E::NOT_ENOUGH_INPUT:
      return "Hex string has odd length";
    case E::NON_HEX_INPUT:
      return "Hex string contains non-hex symbols";
    case E::MISSING_0X_PREFIX:
      return "Hex string does not start with 0x";
  }
  return "Unknown UnhexError";
}

namespace lightbabe::common {

  std::string hex_lower(std::span<const uint8_t> bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower_0x(std::span<const uint8_t> bytes) {
    return "0x" + hex_lower(bytes);
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::NOT_ENOUGH_INPUT;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::NON_HEX_INPUT;
    }
    return bytes;
  }

  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex) {
    if (not hex.starts_with("0x")) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    return unhex(hex.substr(2));
  }

}  // namespace lightbabe::common
