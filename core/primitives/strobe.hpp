/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

#include <nettle/sha3.h>
#include <boost/assert.hpp>

namespace lightbabe::primitives {

  /**
   * STROBE-128 duplex construction over keccak-f[1600]
   * (https://strobe.sourceforge.io/), restricted to the operations needed by
   * Merlin transcripts. Memory layout of the state matches schnorrkel's
   * Strobe128, so the state may be handed over to the library as is.
   */
  class Strobe final {
    static constexpr size_t kBufferSize = 200ull;
    static constexpr uint8_t kStrobeR = 166;

    using Flags = uint8_t;
    using Position = uint8_t;

    static constexpr Flags kFlag_NU = 0x00;  // NU = No Use
    static constexpr Flags kFlag_I = 0x01;
    static constexpr Flags kFlag_A = 0x02;
    static constexpr Flags kFlag_C = 0x04;
    static constexpr Flags kFlag_T = 0x08;
    static constexpr Flags kFlag_M = 0x10;
    static constexpr Flags kFlag_K = 0x20;

    static constexpr size_t kPositionOffset = kBufferSize;
    static constexpr size_t kBeginOffset = kBufferSize + 1ull;
    static constexpr size_t kStateOffset = kBufferSize + 2ull;

    // keccak state followed by position, begin position and current flags
    alignas(8) std::array<uint8_t, kBufferSize + 3ull> raw_data_{};

    Position &currentPosition() {
      return raw_data_[kPositionOffset];
    }

    Position &beginPosition() {
      return raw_data_[kBeginOffset];
    }

    Flags &currentState() {
      return raw_data_[kStateOffset];
    }

    void absorb(std::span<const uint8_t> src) {
      for (const auto i : src) {
        raw_data_[currentPosition()++] ^= i;
        if (kStrobeR == currentPosition()) {
          runF();
        }
      }
    }

    void squeeze(std::span<uint8_t> dst) {
      for (auto &i : dst) {
        i = raw_data_[currentPosition()];
        raw_data_[currentPosition()++] = 0;
        if (kStrobeR == currentPosition()) {
          runF();
        }
      }
    }

    template <bool kMore, Flags kFlags>
    void beginOp() {
      static_assert((kFlags & kFlag_T) == 0, "T flag doesn't support");
      if constexpr (kMore) {
        BOOST_ASSERT(currentState() == kFlags);
        return;
      }

      const uint8_t op[2] = {beginPosition(), kFlags};
      beginPosition() = currentPosition() + 1;
      currentState() = kFlags;
      absorb(op);

      if constexpr (0 != (kFlags & (kFlag_C | kFlag_K))) {
        if (currentPosition() != 0) {
          runF();
        }
      }
    }

    void runF() {
      raw_data_[currentPosition()] ^= beginPosition();
      raw_data_[currentPosition() + 1] ^= 0x04;
      raw_data_[kStrobeR + 1] ^= 0x80;
      permute();

      currentPosition() = 0;
      beginPosition() = 0;
    }

    // lanes are little-endian 64-bit words
    void permute() {
      sha3_state state{};
      std::memcpy(state.a, raw_data_.data(), kBufferSize);
      sha3_permute(&state);
      std::memcpy(raw_data_.data(), state.a, kBufferSize);
    }

   public:
    Strobe() = default;

    Strobe(const Strobe &) = default;
    Strobe &operator=(const Strobe &) = default;

    void initialize(std::span<const uint8_t> label) {
      raw_data_.fill(0);
      const uint8_t domain[6] = {1, kStrobeR + 2, 1, 0, 1, 96};
      std::memcpy(raw_data_.data(), domain, sizeof(domain));
      constexpr std::string_view kVersion = "STROBEv1.0.2";
      std::memcpy(
          raw_data_.data() + sizeof(domain), kVersion.data(), kVersion.size());
      permute();

      currentPosition() = 0;
      currentState() = kFlag_NU;
      beginPosition() = 0;

      metaAd<false>(label);
    }

    template <bool kMore>
    void ad(std::span<const uint8_t> src) {
      beginOp<kMore, kFlag_A>();
      absorb(src);
    }

    template <bool kMore>
    void metaAd(std::span<const uint8_t> label) {
      beginOp<kMore, kFlag_M | kFlag_A>();
      absorb(label);
    }

    template <bool kMore>
    void prf(std::span<uint8_t> data) {
      beginOp<kMore, kFlag_I | kFlag_A | kFlag_C>();
      squeeze(data);
    }

    std::span<const uint8_t> data() const {
      return raw_data_;
    }
  };

}  // namespace lightbabe::primitives
