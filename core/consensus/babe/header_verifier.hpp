/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <variant>

#include "consensus/babe/types/babe_configuration.hpp"
#include "consensus/babe/types/epoch_information.hpp"
#include "consensus/babe/verify_error.hpp"
#include "consensus/timeline/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/block_header.hpp"

namespace lightbabe::consensus::babe {

  class HeaderVerifier;

  /**
   * Input of header verification. Borrows headers and genesis configuration,
   * they must outlive the verification
   */
  struct VerifyConfig {
    /// header to verify
    const primitives::BlockHeader &header;

    /// already verified parent of `header`
    const primitives::BlockHeader &parent_header;

    /// BABE configuration obtained from the genesis block
    const BabeConfiguration &genesis_configuration;

    /// slot of block #1, required for any block except #1 itself
    std::optional<SlotNumber> block1_slot_number;

    /// current time, reserved for future checks of slots from the future
    std::chrono::milliseconds now_from_unix_epoch{};
  };

  /// Result of successful verification
  struct VerifySuccess {
    /// if set, the block is the first of a new epoch, and this is the
    /// information about the *next* epoch
    std::optional<EpochInformation> epoch_change;

    /// slot claimed by the block
    SlotNumber slot_number{};

    /// if the block is produced in primary slot
    bool is_primary{};

    bool operator==(const VerifySuccess &other) const = default;
  };

  /**
   * Verification which waits for information about the epoch of the block.
   * Copies may be finished independently, dropping it has no side effects.
   * Borrows the config and the verifier which started it, they must outlive
   * the pending verification
   */
  class PendingVerify {
   public:
    PendingVerify(VerifyConfig config,
                  EpochNumber epoch_number,
                  const HeaderVerifier &verifier)
        : config_(config), epoch_number_(epoch_number), verifier_(verifier) {}

    /// epoch, which information is expected by `finish`
    EpochNumber epochNumber() const {
      return epoch_number_;
    }

    /**
     * Finishes the verification
     * @param epoch_info authorities and randomness of the epoch returned by
     * epochNumber()
     */
    outcome::result<VerifySuccess> finish(
        const EpochInformation &epoch_info) const;

   private:
    VerifyConfig config_;
    EpochNumber epoch_number_;
    const HeaderVerifier &verifier_;
  };

  using SuccessOrPending = std::variant<VerifySuccess, PendingVerify>;

  /**
   * Verifies BABE block headers in two phases: structural checks, and (when
   * the block is beyond epoch 1) slot claim checks, once the caller supplies
   * the epoch information
   */
  class HeaderVerifier {
   public:
    virtual ~HeaderVerifier() = default;

    /**
     * Checks slot and epoch change structure of the header. Blocks of epochs
     * 0 and 1 are fully verified against the genesis authorities.
     * @return Success, or Pending if information about the epoch is required
     */
    virtual outcome::result<SuccessOrPending> startVerifyHeader(
        const VerifyConfig &config) const = 0;

   private:
    friend class PendingVerify;

    /**
     * Full verification of the header using information about its epoch.
     * Reachable only through PendingVerify returned by startVerifyHeader
     */
    virtual outcome::result<VerifySuccess> finishVerifyHeader(
        const VerifyConfig &config,
        const EpochInformation &epoch_info) const = 0;
  };

}  // namespace lightbabe::consensus::babe
