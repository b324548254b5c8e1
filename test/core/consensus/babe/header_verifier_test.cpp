/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/babe/impl/header_verifier_impl.hpp"

#include <gtest/gtest.h>

#include "consensus/babe/impl/babe_digests_util.hpp"
#include "consensus/babe/impl/prepare_transcript.hpp"
#include "consensus/babe/impl/slot_claim_validator_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/sr25519/sr25519_provider_impl.hpp"
#include "crypto/vrf/vrf_provider_impl.hpp"
#include "mock/core/consensus/babe/slot_claim_validator_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/primitives/babe_digests.hpp"

using namespace lightbabe;
using namespace consensus::babe;
using consensus::EpochNumber;
using consensus::Randomness;
using consensus::SlotNumber;
using crypto::HasherImpl;
using crypto::Sr25519Keypair;
using crypto::Sr25519ProviderImpl;
using crypto::Sr25519Seed;
using crypto::VRFProviderImpl;
using primitives::BlockHeader;
using primitives::BlockNumber;
using primitives::Transcript;
using testutil::babeConsensus;
using testutil::babePreRuntime;
using testutil::babeSeal;
using testing::_;
using testing::Return;

class HeaderVerifierTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    alice = keypairFromSeed(1);
    bob = keypairFromSeed(2);

    genesis_config.slot_duration = 6000;
    genesis_config.epoch_length = 10;
    genesis_config.leadership_rate = {1, 1};
    genesis_config.authorities = {Authority{alice.public_key, 1}};
    genesis_config.randomness.fill(9);
    genesis_config.allowed_slots = AllowedSlots::PrimaryAndSecondaryPlain;

    next_epoch.authorities = {Authority{alice.public_key, 1}};
    next_epoch.randomness.fill(11);

    epoch2_info = EpochInformation{
        .authorities = next_epoch.authorities,
        .randomness = next_epoch.randomness,
        .configuration = std::nullopt,
    };

    block1 = makeBlock(genesis, 1, primaryClaim(kBlock1Slot, 0));
  }

  Sr25519Keypair keypairFromSeed(uint8_t byte) const {
    Sr25519Seed seed;
    seed.fill(byte);
    return sr25519_provider->generateKeypair(seed);
  }

  /// Primary claim of the first authority with VRF produced by `keypair`
  BabeBlockHeader primaryClaim(SlotNumber slot,
                               EpochNumber epoch,
                               std::optional<Randomness> randomness = {},
                               std::optional<Sr25519Keypair> keypair = {}) {
    BabeBlockHeader babe_header{
        .slot_assignment_type = SlotType::Primary,
        .authority_index = 0,
        .slot_number = slot,
    };
    Transcript transcript;
    prepareTranscript(transcript,
                      randomness.value_or(genesis_config.randomness),
                      slot,
                      epoch);
    babe_header.vrf_output =
        vrf_provider->signTranscript(transcript, keypair.value_or(alice))
            .value();
    return babe_header;
  }

  BabeBlockHeader secondaryPlainClaim(SlotNumber slot) const {
    return BabeBlockHeader{
        .slot_assignment_type = SlotType::SecondaryPlain,
        .authority_index = 0,
        .slot_number = slot,
    };
  }

  /// Builds header with pre-digest and logs, sealed by `signer`
  BlockHeader makeBlock(const BlockHeader &parent,
                        BlockNumber number,
                        const BabeBlockHeader &babe_header,
                        const std::vector<ConsensusLog> &logs = {},
                        std::optional<Sr25519Keypair> signer = {}) const {
    BlockHeader header;
    header.parent_hash = hasher->blake2b_256(scale::encode(parent).value());
    header.number = number;
    header.digest.emplace_back(babePreRuntime(babe_header));
    for (const auto &log : logs) {
      header.digest.emplace_back(babeConsensus(log));
    }
    auto pre_seal_hash = hasher->blake2b_256(scale::encode(header).value());
    auto signature =
        sr25519_provider->sign(signer.value_or(alice), pre_seal_hash).value();
    header.digest.emplace_back(babeSeal(signature));
    return header;
  }

  outcome::result<SuccessOrPending> start(
      const BlockHeader &header,
      const BlockHeader &parent,
      std::optional<SlotNumber> block1_slot = kBlock1Slot) const {
    return verifier->startVerifyHeader(VerifyConfig{
        .header = header,
        .parent_header = parent,
        .genesis_configuration = genesis_config,
        .block1_slot_number = block1_slot,
    });
  }

  static constexpr SlotNumber kBlock1Slot = 100;

  std::shared_ptr<HasherImpl> hasher = std::make_shared<HasherImpl>();
  std::shared_ptr<Sr25519ProviderImpl> sr25519_provider =
      std::make_shared<Sr25519ProviderImpl>();
  std::shared_ptr<VRFProviderImpl> vrf_provider =
      std::make_shared<VRFProviderImpl>();
  std::shared_ptr<SlotClaimValidatorImpl> slot_claim_validator =
      std::make_shared<SlotClaimValidatorImpl>(
          hasher, sr25519_provider, vrf_provider);
  std::shared_ptr<HeaderVerifierImpl> verifier =
      std::make_shared<HeaderVerifierImpl>(hasher, slot_claim_validator);

  Sr25519Keypair alice;
  Sr25519Keypair bob;
  BabeConfiguration genesis_config;
  NextEpochDescriptor next_epoch;
  EpochInformation epoch2_info;

  BlockHeader genesis;
  BlockHeader block1;
};

/**
 * @given block #1 with valid primary claim, and the known slot of block #1
 * @when header is verified
 * @then it is valid without additional information about epoch
 */
TEST_F(HeaderVerifierTest, Block1) {
  EXPECT_OUTCOME_TRUE(res, start(block1, genesis));
  ASSERT_TRUE(std::holds_alternative<VerifySuccess>(res));
  EXPECT_EQ(std::get<VerifySuccess>(res),
            (VerifySuccess{.epoch_change = std::nullopt,
                           .slot_number = kBlock1Slot,
                           .is_primary = true}));
}

/**
 * @given block #1 of slot 500 and no known slot of block #1
 * @when header is verified
 * @then it is in epoch 0 and valid
 */
TEST_F(HeaderVerifierTest, Block1WithoutKnownBlock1Slot) {
  auto header = makeBlock(genesis, 1, primaryClaim(500, 0));

  EXPECT_OUTCOME_TRUE(res, start(header, genesis, std::nullopt));
  ASSERT_TRUE(std::holds_alternative<VerifySuccess>(res));
  EXPECT_EQ(std::get<VerifySuccess>(res).slot_number, 500);
  EXPECT_FALSE(std::get<VerifySuccess>(res).epoch_change.has_value());
}

/**
 * @given block #1 announcing the next epoch
 * @when header is verified
 * @then UNEXPECTED_EPOCH_CHANGE_LOG error is returned, as block #1 is in
 * epoch 0 as well as genesis
 */
TEST_F(HeaderVerifierTest, Block1WithEpochChangeLogRejected) {
  auto header =
      makeBlock(genesis, 1, primaryClaim(kBlock1Slot, 0), {next_epoch});

  EXPECT_EC(start(header, genesis), VerifyError::UNEXPECTED_EPOCH_CHANGE_LOG);
}

/**
 * @given block #2 in the same epoch as its parent
 * @when header is verified
 * @then it is valid and does not change epoch
 */
TEST_F(HeaderVerifierTest, SameEpoch) {
  auto header = makeBlock(block1, 2, primaryClaim(105, 0));

  EXPECT_OUTCOME_TRUE(res, start(header, block1));
  ASSERT_TRUE(std::holds_alternative<VerifySuccess>(res));
  EXPECT_EQ(std::get<VerifySuccess>(res),
            (VerifySuccess{.epoch_change = std::nullopt,
                           .slot_number = 105,
                           .is_primary = true}));
}

/**
 * @given block #2 produced in secondary plain slot by the assigned authority
 * @when header is verified
 * @then it is valid and not primary
 */
TEST_F(HeaderVerifierTest, SecondaryPlainSlot) {
  auto header = makeBlock(block1, 2, secondaryPlainClaim(105));

  EXPECT_OUTCOME_TRUE(res, start(header, block1));
  ASSERT_TRUE(std::holds_alternative<VerifySuccess>(res));
  EXPECT_FALSE(std::get<VerifySuccess>(res).is_primary);
}

/**
 * @given block #2 in the epoch of its parent, announcing the next epoch
 * @when header is verified
 * @then UNEXPECTED_EPOCH_CHANGE_LOG error is returned
 */
TEST_F(HeaderVerifierTest, UnexpectedEpochChange) {
  auto header = makeBlock(block1, 2, primaryClaim(105, 0), {next_epoch});

  EXPECT_EC(start(header, block1), VerifyError::UNEXPECTED_EPOCH_CHANGE_LOG);
}

/**
 * @given block #2 of the epoch following the epoch of its parent, without
 * announcement of the next epoch
 * @when header is verified
 * @then MISSING_EPOCH_CHANGE_LOG error is returned
 */
TEST_F(HeaderVerifierTest, MissingEpochChange) {
  auto header = makeBlock(block1, 2, primaryClaim(109, 1));

  EXPECT_EC(start(header, block1), VerifyError::MISSING_EPOCH_CHANGE_LOG);
}

/**
 * @given first block of epoch 1 announcing epoch 2 with new configuration
 * @when header is verified
 * @then it is valid, announced epoch carries the new configuration
 */
TEST_F(HeaderVerifierTest, EpochChangeWithConfig) {
  NextConfigDataV1 next_config{
      .leadership_rate = {1, 2},
      .allowed_slots = AllowedSlots::PrimaryOnly,
  };
  auto header =
      makeBlock(block1, 2, primaryClaim(109, 1), {next_epoch, next_config});

  EXPECT_OUTCOME_TRUE(res, start(header, block1));
  ASSERT_TRUE(std::holds_alternative<VerifySuccess>(res));

  auto expected = epoch2_info;
  expected.configuration = EpochConfiguration{
      .leadership_rate = {1, 2},
      .allowed_slots = AllowedSlots::PrimaryOnly,
  };
  EXPECT_EQ(std::get<VerifySuccess>(res).epoch_change, expected);
}

/**
 * @given block #2 with configuration change but without epoch change
 * @when header is verified
 * @then configuration change is ignored
 */
TEST_F(HeaderVerifierTest, ConfigChangeWithoutEpochChange) {
  NextConfigDataV1 next_config{
      .leadership_rate = {1, 2},
      .allowed_slots = AllowedSlots::PrimaryOnly,
  };
  auto header = makeBlock(block1, 2, primaryClaim(105, 0), {next_config});

  EXPECT_OUTCOME_TRUE(res, start(header, block1));
  ASSERT_TRUE(std::holds_alternative<VerifySuccess>(res));
  EXPECT_FALSE(std::get<VerifySuccess>(res).epoch_change.has_value());
}

/**
 * @given block #3 of epoch 2
 * @when header is verified
 * @then verification waits for information about epoch 2, and finishes
 * successfully with it, as many times as asked
 */
TEST_F(HeaderVerifierTest, PendingEpochInformation) {
  auto block2 = makeBlock(block1, 2, primaryClaim(109, 1), {next_epoch});
  auto block3 = makeBlock(block2,
                          3,
                          primaryClaim(120, 2, next_epoch.randomness),
                          {next_epoch});

  EXPECT_OUTCOME_TRUE(res, start(block3, block2));
  ASSERT_TRUE(std::holds_alternative<PendingVerify>(res));
  const auto &pending = std::get<PendingVerify>(res);
  EXPECT_EQ(pending.epochNumber(), 2);

  VerifySuccess expected{
      .epoch_change = epoch2_info,
      .slot_number = 120,
      .is_primary = true,
  };
  EXPECT_OUTCOME_TRUE(success, pending.finish(epoch2_info));
  EXPECT_EQ(success, expected);

  auto pending_copy = pending;
  EXPECT_OUTCOME_TRUE(success_again, pending_copy.finish(epoch2_info));
  EXPECT_EQ(success_again, expected);
}

/**
 * @given block #3, the first one of epoch 3, announcing epoch 4 with new
 * configuration
 * @when verification is finished with information about epoch 3
 * @then announced epoch carries the new configuration
 */
TEST_F(HeaderVerifierTest, PendingEpochChangeWithConfig) {
  NextConfigDataV1 next_config{
      .leadership_rate = {1, 4},
      .allowed_slots = AllowedSlots::PrimaryAndSecondaryVRF,
  };
  auto block2 = makeBlock(block1, 2, primaryClaim(109, 1), {next_epoch});
  auto block3 = makeBlock(block2,
                          3,
                          primaryClaim(130, 3, next_epoch.randomness),
                          {next_epoch, next_config});

  EXPECT_OUTCOME_TRUE(res, start(block3, block2));
  ASSERT_TRUE(std::holds_alternative<PendingVerify>(res));
  const auto &pending = std::get<PendingVerify>(res);
  EXPECT_EQ(pending.epochNumber(), 3);

  auto expected = epoch2_info;
  expected.configuration = EpochConfiguration{
      .leadership_rate = {1, 4},
      .allowed_slots = AllowedSlots::PrimaryAndSecondaryVRF,
  };
  EXPECT_OUTCOME_TRUE(success, pending.finish(epoch2_info));
  EXPECT_EQ(success.epoch_change, expected);
}

/**
 * @given verifier owned by the caller without a shared pointer
 * @when verification of block #3 of epoch 2 is started and finished
 * @then pending verification uses the verifier which started it
 */
TEST_F(HeaderVerifierTest, VerifierNotOwnedBySharedPtr) {
  HeaderVerifierImpl local_verifier(hasher, slot_claim_validator);
  auto block2 = makeBlock(block1, 2, primaryClaim(109, 1), {next_epoch});
  auto block3 = makeBlock(
      block2, 3, primaryClaim(120, 2, next_epoch.randomness), {next_epoch});

  EXPECT_OUTCOME_TRUE(res,
                      local_verifier.startVerifyHeader(VerifyConfig{
                          .header = block3,
                          .parent_header = block2,
                          .genesis_configuration = genesis_config,
                          .block1_slot_number = kBlock1Slot,
                      }));
  ASSERT_TRUE(std::holds_alternative<PendingVerify>(res));
  EXPECT_OUTCOME_TRUE(success, std::get<PendingVerify>(res).finish(epoch2_info));
  EXPECT_EQ(success.slot_number, 120);
}

template <typename Verifier>
concept FinishableWithoutStart = requires(const Verifier &verifier,
                                          const VerifyConfig &config,
                                          const EpochInformation &epoch_info) {
  verifier.finishVerifyHeader(config, epoch_info);
};

/**
 * @given header verifier interface and its implementation
 * @when second phase of verification is called directly
 * @then it does not compile, only PendingVerify can finish verification
 */
TEST_F(HeaderVerifierTest, FinishOnlyThroughPending) {
  static_assert(not FinishableWithoutStart<HeaderVerifier>);
  static_assert(not FinishableWithoutStart<HeaderVerifierImpl>);
}

/**
 * @given block #3 pending for epoch 2
 * @when verification is finished with information of another epoch
 * @then the slot claim is rejected
 */
TEST_F(HeaderVerifierTest, PendingWithWrongEpochInformation) {
  auto block2 = makeBlock(block1, 2, primaryClaim(109, 1), {next_epoch});
  auto block3 = makeBlock(block2,
                          3,
                          primaryClaim(120, 2, next_epoch.randomness),
                          {next_epoch});

  EXPECT_OUTCOME_TRUE(res, start(block3, block2));
  ASSERT_TRUE(std::holds_alternative<PendingVerify>(res));
  const auto &pending = std::get<PendingVerify>(res);

  auto bob_epoch = epoch2_info;
  bob_epoch.authorities = {Authority{bob.public_key, 1}};
  EXPECT_EC(pending.finish(bob_epoch), SlotClaimError::INVALID_VRF);

  auto other_randomness = epoch2_info;
  other_randomness.randomness.fill(12);
  EXPECT_EC(pending.finish(other_randomness), SlotClaimError::INVALID_VRF);

  auto empty_epoch = epoch2_info;
  empty_epoch.authorities.clear();
  EXPECT_EC(pending.finish(empty_epoch), SlotClaimError::NO_VALIDATOR);
}

/**
 * @given block #3 of epoch 2 in secondary plain slot
 * @when verification is finished with epoch configuration allowing primary
 * slots only
 * @then the configuration of the epoch overrides genesis one and the block is
 * rejected
 */
TEST_F(HeaderVerifierTest, EpochConfigurationOverridesGenesis) {
  auto block2 = makeBlock(block1, 2, primaryClaim(109, 1), {next_epoch});
  auto block3 = makeBlock(block2, 3, secondaryPlainClaim(120), {next_epoch});

  EXPECT_OUTCOME_TRUE(res, start(block3, block2));
  ASSERT_TRUE(std::holds_alternative<PendingVerify>(res));
  const auto &pending = std::get<PendingVerify>(res);

  EXPECT_OUTCOME_TRUE_1(pending.finish(epoch2_info));

  auto primary_only = epoch2_info;
  primary_only.configuration = EpochConfiguration{
      .leadership_rate = {1, 1},
      .allowed_slots = AllowedSlots::PrimaryOnly,
  };
  EXPECT_EC(pending.finish(primary_only),
            SlotClaimError::SECONDARY_SLOT_ASSIGNMENTS_DISABLED);
}

/**
 * @given primary claim with VRF produced by a key of another authority
 * @when header is verified
 * @then INVALID_VRF error is returned
 */
TEST_F(HeaderVerifierTest, InvalidVRF) {
  auto header = makeBlock(
      block1, 2, primaryClaim(105, 0, std::nullopt, bob));

  EXPECT_EC(start(header, block1), SlotClaimError::INVALID_VRF);
}

/**
 * @given block sealed by another key than the author's one
 * @when header is verified
 * @then INVALID_SIGNATURE error is returned
 */
TEST_F(HeaderVerifierTest, InvalidSeal) {
  auto header = makeBlock(block1, 2, primaryClaim(105, 0), {}, bob);

  EXPECT_EC(start(header, block1), SlotClaimError::INVALID_SIGNATURE);
}

/**
 * @given block modified after sealing
 * @when header is verified
 * @then INVALID_SIGNATURE error is returned
 */
TEST_F(HeaderVerifierTest, ModifiedAfterSeal) {
  auto header = makeBlock(block1, 2, primaryClaim(105, 0));
  header.state_root.fill(1);

  EXPECT_EC(start(header, block1), SlotClaimError::INVALID_SIGNATURE);
}

/**
 * @given block #2 of the same slot as its parent
 * @when header is verified
 * @then SLOT_NUMBER_NOT_INCREASING error is returned
 */
TEST_F(HeaderVerifierTest, SlotNotIncreasing) {
  auto header = makeBlock(block1, 2, primaryClaim(kBlock1Slot, 0));

  EXPECT_EC(start(header, block1), VerifyError::SLOT_NUMBER_NOT_INCREASING);
}

/**
 * @given block #2 and unknown slot of block #1
 * @when header is verified
 * @then MISSING_BLOCK1_SLOT_NUMBER error is returned
 */
TEST_F(HeaderVerifierTest, MissingBlock1Slot) {
  auto header = makeBlock(block1, 2, primaryClaim(105, 0));

  EXPECT_EC(start(header, block1, std::nullopt),
            VerifyError::MISSING_BLOCK1_SLOT_NUMBER);
}

/**
 * @given block #3 whose parent has no BABE digests
 * @when header is verified
 * @then BAD_PARENT_HEADER error is returned
 */
TEST_F(HeaderVerifierTest, BadParent) {
  BlockHeader block2;
  block2.number = 2;
  auto header = makeBlock(block2, 3, primaryClaim(106, 0));

  EXPECT_EC(start(header, block2), VerifyError::BAD_PARENT_HEADER);
}

/**
 * @given header without BABE digests
 * @when header is verified
 * @then digest error is returned as is
 */
TEST_F(HeaderVerifierTest, NoDigests) {
  BlockHeader header;
  header.number = 2;

  EXPECT_EC(start(header, block1), DigestError::REQUIRED_DIGESTS_NOT_FOUND);
}

class HeaderVerifierClaimTest : public HeaderVerifierTest {
 public:
  std::shared_ptr<SlotClaimValidatorMock> slot_claim_validator_mock =
      std::make_shared<SlotClaimValidatorMock>();
  std::shared_ptr<HeaderVerifierImpl> verifier_with_mock =
      std::make_shared<HeaderVerifierImpl>(hasher, slot_claim_validator_mock);
};

/**
 * @given sealed block #2
 * @when header is verified
 * @then slot claim is validated against the hash of the header without seal,
 * epoch of the block, genesis epoch and genesis configuration
 */
TEST_F(HeaderVerifierClaimTest, ClaimArguments) {
  auto header = makeBlock(block1, 2, primaryClaim(105, 0));
  auto unsealed = header;
  unsealed.digest.pop_back();
  auto pre_seal_hash = hasher->blake2b_256(scale::encode(unsealed).value());

  EXPECT_OUTCOME_TRUE(babe_header, getBabeBlockHeader(header));
  EXPECT_OUTCOME_TRUE(seal, getSeal(header));
  EpochInformation genesis_epoch{
      .authorities = genesis_config.authorities,
      .randomness = genesis_config.randomness,
      .configuration = std::nullopt,
  };
  EpochConfiguration genesis_epoch_config{
      .leadership_rate = genesis_config.leadership_rate,
      .allowed_slots = genesis_config.allowed_slots,
  };

  EXPECT_CALL(*slot_claim_validator_mock,
              validateSlotClaim(babe_header,
                                seal,
                                pre_seal_hash,
                                EpochNumber{0},
                                genesis_epoch,
                                genesis_epoch_config))
      .WillOnce(Return(outcome::success()));

  EXPECT_OUTCOME_TRUE(res,
                      verifier_with_mock->startVerifyHeader(VerifyConfig{
                          .header = header,
                          .parent_header = block1,
                          .genesis_configuration = genesis_config,
                          .block1_slot_number = kBlock1Slot,
                      }));
  EXPECT_TRUE(std::holds_alternative<VerifySuccess>(res));
}

/**
 * @given block #2 with an invalid slot claim
 * @when header is verified
 * @then error of the slot claim validation is returned as is
 */
TEST_F(HeaderVerifierClaimTest, ClaimErrorIsPropagated) {
  auto header = makeBlock(block1, 2, primaryClaim(105, 0));

  EXPECT_CALL(*slot_claim_validator_mock, validateSlotClaim(_, _, _, _, _, _))
      .WillOnce(Return(SlotClaimError::INVALID_SECONDARY_SLOT_AUTHOR));

  EXPECT_EC(verifier_with_mock->startVerifyHeader(VerifyConfig{
                .header = header,
                .parent_header = block1,
                .genesis_configuration = genesis_config,
                .block1_slot_number = kBlock1Slot,
            }),
            SlotClaimError::INVALID_SECONDARY_SLOT_AUTHOR);
}
