/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "consensus/babe/types/babe_block_header.hpp"
#include "consensus/babe/types/babe_configuration.hpp"
#include "consensus/babe/types/consensus_log.hpp"
#include "testutil/outcome.hpp"

using namespace lightbabe::consensus;
using namespace lightbabe::consensus::babe;

namespace {
  void putUint64(std::vector<uint8_t> &out, uint64_t value) {
    for (size_t i = 0; i < 8; ++i) {
      out.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
  }
}  // namespace

/**
 * @given bytes of the BabeApi_configuration response
 * @when they are decoded
 * @then every field of the configuration is read in order
 */
TEST(BabeTypesCodecTest, DecodeConfiguration) {
  std::vector<uint8_t> bytes;
  putUint64(bytes, 6000);  // slot duration
  putUint64(bytes, 600);   // epoch length
  putUint64(bytes, 1);     // c numerator
  putUint64(bytes, 4);     // c denominator
  bytes.push_back(1 << 2);  // one authority
  bytes.insert(bytes.end(), 32, 0xaa);
  putUint64(bytes, 1);
  bytes.insert(bytes.end(), 32, 0xbb);  // randomness
  bytes.push_back(2);                   // PrimaryAndSecondaryVRF

  EXPECT_OUTCOME_TRUE(config, scale::decode<BabeConfiguration>(bytes));
  EXPECT_EQ(config.slot_duration.count(), 6000);
  EXPECT_EQ(config.slotsPerEpoch(), 600);
  EXPECT_EQ(config.leadership_rate, (LeadershipRate{1, 4}));
  ASSERT_EQ(config.authorities.size(), 1);
  EXPECT_EQ(config.authorities[0].id[31], 0xaa);
  EXPECT_EQ(config.authorities[0].weight, 1);
  EXPECT_EQ(config.randomness[0], 0xbb);
  EXPECT_EQ(config.allowed_slots, AllowedSlots::PrimaryAndSecondaryVRF);

  EXPECT_OUTCOME_TRUE(encoded, scale::encode(config));
  EXPECT_EQ(encoded, bytes);
}

/**
 * @given configuration bytes with unknown kind of allowed slots
 * @when they are decoded
 * @then decoding fails
 */
TEST(BabeTypesCodecTest, UnknownAllowedSlots) {
  std::vector<uint8_t> bytes;
  for (auto i = 0; i < 4; ++i) {
    putUint64(bytes, 1);
  }
  bytes.push_back(0);  // no authorities
  bytes.insert(bytes.end(), 32, 0);
  bytes.push_back(3);

  EXPECT_EC(scale::decode<BabeConfiguration>(bytes),
            scale::DecodeError::UNEXPECTED_VALUE);
}

/**
 * @given secondary plain pre-digest
 * @when it is encoded
 * @then it consists of slot type, authority index and slot, without VRF
 */
TEST(BabeTypesCodecTest, SecondaryPlainPreDigest) {
  BabeBlockHeader babe_header{
      .slot_assignment_type = SlotType::SecondaryPlain,
      .authority_index = 1,
      .slot_number = 2,
  };

  EXPECT_OUTCOME_TRUE(encoded, scale::encode(babe_header));
  std::vector<uint8_t> expected{2, 1, 0, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0};
  EXPECT_EQ(encoded, expected);
}

/**
 * @given primary pre-digest
 * @when it is encoded
 * @then VRF output and proof follow the slot
 */
TEST(BabeTypesCodecTest, PrimaryPreDigest) {
  BabeBlockHeader babe_header{
      .slot_assignment_type = SlotType::Primary,
      .authority_index = 1,
      .slot_number = 2,
  };
  babe_header.vrf_output.output.fill(3);
  babe_header.vrf_output.proof.fill(4);

  EXPECT_OUTCOME_TRUE(encoded, scale::encode(babe_header));
  ASSERT_EQ(encoded.size(), 13 + 32 + 64);
  EXPECT_EQ(encoded[0], 1);
  EXPECT_EQ(encoded[13], 3);
  EXPECT_EQ(encoded.back(), 4);

  EXPECT_OUTCOME_TRUE(decoded, scale::decode<BabeBlockHeader>(encoded));
  EXPECT_EQ(decoded, babe_header);
}

/**
 * @given NextConfigData log with unsupported version
 * @when it is decoded
 * @then decoding fails
 */
TEST(BabeTypesCodecTest, NextConfigDataVersion) {
  std::vector<uint8_t> bytes{3, 2};  // log index, version
  putUint64(bytes, 1);
  putUint64(bytes, 2);
  bytes.push_back(0);

  EXPECT_EC(scale::decode<ConsensusLog>(bytes),
            scale::DecodeError::WRONG_TYPE_INDEX);

  bytes[1] = 1;
  EXPECT_OUTCOME_TRUE(log, scale::decode<ConsensusLog>(bytes));
  auto *config = boost::get<NextConfigDataV1>(&log);
  ASSERT_NE(config, nullptr);
  EXPECT_EQ(config->leadership_rate, (LeadershipRate{1, 2}));
  EXPECT_EQ(config->allowed_slots, AllowedSlots::PrimaryOnly);
}
