/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "consensus/babe/types/slot_type.hpp"
#include "consensus/timeline/types.hpp"
#include "crypto/sr25519_types.hpp"

namespace lightbabe::consensus::babe {
  /**
   * Contains specific data, needed in BABE for validation
   *
   * @see
   * https://github.com/paritytech/substrate/blob/polkadot-v0.9.8/primitives/consensus/babe/src/digests.rs#L74
   */
  struct BabeBlockHeader {
    SlotType slot_assignment_type{SlotType::Primary};

    /// authority index of the producer
    AuthorityIndex authority_index{};

    /// slot, in which the block was produced
    SlotNumber slot_number{};

    /// output of VRF function
    crypto::VRFOutput vrf_output{};

    bool operator==(const BabeBlockHeader &other) const = default;

    SlotType slotType() const {
      return slot_assignment_type;
    }

    bool needVRFCheck() const {
      return slot_assignment_type == SlotType::Primary
          or slot_assignment_type == SlotType::SecondaryVRF;
    }

    bool needVRFWithThresholdCheck() const {
      return slot_assignment_type == SlotType::Primary;
    }

    bool isProducedInSecondarySlot() const {
      return slot_assignment_type == SlotType::SecondaryPlain
          or slot_assignment_type == SlotType::SecondaryVRF;
    }

    /**
     * @brief outputs object of type BabeBlockHeader to stream
     * @param s stream reference
     * @param bh value to output
     * @return reference to stream
     */
    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const BabeBlockHeader &bh) {
      s << static_cast<uint8_t>(bh.slot_assignment_type) << bh.authority_index
        << bh.slot_number;
      if (bh.needVRFCheck()) {
        s << bh.vrf_output;
      }
      return s;
    }

    /**
     * @brief decodes object of type BabeBlockHeader from stream
     * @param s stream reference
     * @param bh value to decode into
     * @return reference to stream
     */
    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, BabeBlockHeader &bh) {
      uint8_t type{};
      s >> type;
      if (type < static_cast<uint8_t>(SlotType::Primary)
          or type > static_cast<uint8_t>(SlotType::SecondaryVRF)) {
        ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
      }
      bh.slot_assignment_type = static_cast<SlotType>(type);
      s >> bh.authority_index >> bh.slot_number;
      if (bh.needVRFCheck()) {
        s >> bh.vrf_output;
      } else {
        bh.vrf_output = {};
      }
      return s;
    }
  };
}  // namespace lightbabe::consensus::babe
