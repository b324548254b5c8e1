/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/int_serialization.hpp"

#include <boost/assert.hpp>

namespace lightbabe::common {

  namespace {
    template <size_t size, typename uint>
    inline std::array<uint8_t, size> uint_to_le_bytes(const uint &i) {
      std::array<uint8_t, size> res{};
      res.fill(0);
      export_bits(i, res.begin(), 8, false);
      return res;
    }

    template <size_t size, typename uint>
    inline uint be_bytes_to_uint(std::span<const uint8_t> bytes) {
      BOOST_ASSERT(bytes.size() >= size);
      uint result;
      import_bits(result, bytes.begin(), bytes.begin() + size, 8, true);
      return result;
    }
  }  // namespace

  std::array<uint8_t, 16> uint128_to_le_bytes(const uint128_t &i) {
    return uint_to_le_bytes<16>(i);
  }

  uint256_t be_bytes_to_uint256(std::span<const uint8_t> bytes) {
    return be_bytes_to_uint<32, uint256_t>(bytes);
  }

}  // namespace lightbabe::common
