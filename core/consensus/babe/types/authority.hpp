/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "crypto/sr25519_types.hpp"

namespace lightbabe::consensus::babe {

  using AuthorityId = crypto::Sr25519PublicKey;

  using AuthorityWeight = uint64_t;

  struct Authority {
    AuthorityId id;
    AuthorityWeight weight{};

    bool operator==(const Authority &other) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const Authority &a) {
      return s << a.id << a.weight;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, Authority &a) {
      return s >> a.id >> a.weight;
    }
  };

  using Authorities = std::vector<Authority>;

}  // namespace lightbabe::consensus::babe
