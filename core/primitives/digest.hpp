/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "common/unused.hpp"

namespace lightbabe::primitives {

  /// Consensus engine unique ID.
  using ConsensusEngineId = common::Blob<4>;

  inline const auto kBabeEngineId =
      ConsensusEngineId(std::array<uint8_t, 4>{'B', 'A', 'B', 'E'});

  /// Common part of the digest items, which are produced by consensus engine
  struct DigestItemCommon {
    ConsensusEngineId consensus_engine_id;
    common::Buffer data;

    bool operator==(const DigestItemCommon &other) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const DigestItemCommon &item) {
      return s << item.consensus_engine_id << item.data;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, DigestItemCommon &item) {
      return s >> item.consensus_engine_id >> item.data;
    }
  };

  /// A message from the runtime to the consensus engine. This should *never*
  /// be generated by the native code of any consensus engine, but this is not
  /// checked (yet).
  struct Consensus : public DigestItemCommon {};

  /// Put a Seal on it. This is only used by native code, and is never seen
  /// by runtimes.
  struct Seal : public DigestItemCommon {};

  /// A pre-runtime digest.
  ///
  /// These are messages from the consensus engine to the runtime, although
  /// the consensus engine can (and should) read them itself to avoid
  /// code and state duplication. It is erroneous for a runtime to produce
  /// these, but this is not (yet) checked.
  struct PreRuntime : public DigestItemCommon {};

  /// Digest item that contains signal of changed runtime environment.
  struct RuntimeEnvironmentUpdated {
    bool operator==(const RuntimeEnvironmentUpdated &) const = default;

    friend inline ::scale::ScaleEncoderStream &operator<<(
        ::scale::ScaleEncoderStream &s, const RuntimeEnvironmentUpdated &) {
      return s;
    }

    friend inline ::scale::ScaleDecoderStream &operator>>(
        ::scale::ScaleDecoderStream &s, RuntimeEnvironmentUpdated &) {
      return s;
    }
  };

  /// Some other thing. Unsupported and experimental.
  using Other = common::Buffer;

  /**
   * Digest item that is able to encode/decode 'system' digest items and
   * provide opaque access to other items.
   * Note: order of types in variant matters. Should match type ids from here:
   * https://github.com/paritytech/substrate/blob/polkadot-v0.9.8/primitives/runtime/src/generic/digest.rs#L272
   */
  using DigestItem = boost::variant<Other,                        // 0
                                    Unused<1>,                    // 1
                                    Unused<2>,                    // 2
                                    Unused<3>,                    // 3
                                    Consensus,                    // 4
                                    Seal,                         // 5
                                    PreRuntime,                   // 6
                                    Unused<7>,                    // 7
                                    RuntimeEnvironmentUpdated>;   // 8

  /**
   * Digest is an implementation- and usage-defined entity, for example,
   * information, needed to verify the block
   */
  using Digest = std::vector<DigestItem>;

}  // namespace lightbabe::primitives
