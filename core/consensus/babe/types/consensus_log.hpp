/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>

#include "common/unused.hpp"
#include "consensus/babe/types/next_config_data.hpp"
#include "consensus/babe/types/next_epoch_descriptor.hpp"

namespace lightbabe::consensus::babe {

  /// Disable the authority with given index.
  struct OnDisabled {
    AuthorityIndex authority_index{};

    bool operator==(const OnDisabled &other) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const OnDisabled &v) {
      return s << v.authority_index;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, OnDisabled &v) {
      return s >> v.authority_index;
    }
  };

  /**
   * A consensus log item for BABE.
   * Name and implementation are taken from substrate.
   */
  using ConsensusLog =
      boost::variant<Unused<0>,

                     /// The epoch has changed. This provides
                     /// information about the _next_ epoch -
                     /// information about the _current_ epoch (i.e.
                     /// the one we've just entered) should already
                     /// be available earlier in the chain.
                     NextEpochDescriptor,  // = 1

                     OnDisabled,  // = 2

                     /// The epoch has changed, and the epoch after the
                     /// current one will enact different epoch
                     /// configurations.
                     NextConfigDataV1>;  // = 3

}  // namespace lightbabe::consensus::babe
