/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/threshold_util.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <boost/assert.hpp>
#include <boost/range/adaptors.hpp>
#include <boost/range/numeric.hpp>

namespace lightbabe::consensus::babe {

  Threshold calculateThreshold(const LeadershipRate &ratio,
                               const Authorities &authorities,
                               AuthorityIndex authority_index) {
    BOOST_ASSERT(authority_index < authorities.size());

    using boost::adaptors::transformed;
    double total_weight =
        boost::accumulate(authorities | transformed([](const auto &authority) {
                            return double(authority.weight);
                          }),
                          0.);
    if (ratio.second == 0 or total_weight == 0.) {
      return Threshold{0};
    }

    double float_point_ratio =
        std::min(1., double(ratio.first) / double(ratio.second));
    double theta = double(authorities[authority_index].weight) / total_weight;

    using namespace boost::multiprecision;  // NOLINT
    cpp_rational p_rat(1. - std::pow(1. - float_point_ratio, theta));
    static const auto a = (uint256_t{1} << 128);
    uint256_t threshold{a * numerator(p_rat) / denominator(p_rat)};

    // p == 1 does not fit into 128 bits
    static const uint256_t max{std::numeric_limits<Threshold>::max()};
    if (threshold > max) {
      return std::numeric_limits<Threshold>::max();
    }
    return Threshold{threshold};
  }

}  // namespace lightbabe::consensus::babe
