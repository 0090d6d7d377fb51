/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "pallets/system/pallet.hpp"

#include <gtest/gtest.h>

#include "testutil/pallets/test_config.hpp"
#include "testutil/prepare_loggers.hpp"

using minichain::primitives::BlockHash;
using testutil::TestConfig;

class SystemPalletTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    system_ = std::make_unique<minichain::system::Pallet<TestConfig>>();
  }

 protected:
  std::unique_ptr<minichain::system::Pallet<TestConfig>> system_;
};

/**
 * @given fresh system pallet
 * @when block number and a nonce are incremented
 * @then block number is 1, nonce of that account is 1, other accounts have
 * no nonce entry
 */
TEST_F(SystemPalletTest, BlockNumberAndNonce) {
  system_->incBlockNumber();
  system_->incNonce("Temi");

  EXPECT_EQ(system_->blockNumber(), 1);
  EXPECT_EQ(system_->nonce("Temi"), 1);
  EXPECT_EQ(system_->nonce("Faithful"), 0);
  EXPECT_FALSE(system_->nonces().contains("Faithful"));
}

/**
 * @given genesis block finalized
 * @when next block is finalized
 * @then both hashes are stored, current and parent hashes follow the block
 * number, hashes differ
 */
TEST_F(SystemPalletTest, BlockHashGeneration) {
  auto genesis_hash = system_->finalizeBlock();
  EXPECT_EQ(system_->blockNumber(), 0);
  EXPECT_EQ(system_->getBlockHash(0), genesis_hash);
  EXPECT_EQ(system_->currentBlockHash(), genesis_hash);
  EXPECT_EQ(system_->genesisHash(), genesis_hash);

  system_->incBlockNumber();
  system_->incNonce("Alice");
  auto block_1_hash = system_->finalizeBlock();

  EXPECT_EQ(system_->blockNumber(), 1);
  EXPECT_EQ(system_->getBlockHash(1), block_1_hash);
  EXPECT_EQ(system_->currentBlockHash(), block_1_hash);
  EXPECT_EQ(system_->parentBlockHash(), genesis_hash);
  EXPECT_NE(genesis_hash, block_1_hash);
}

/**
 * @given a finalized block
 * @when it is finalized again without changes
 * @then the hash is the same, it changes once block number and nonces change
 */
TEST_F(SystemPalletTest, BlockHashConsistency) {
  auto hash_1 = system_->finalizeBlock();
  auto hash_2 = system_->finalizeBlock();
  EXPECT_EQ(hash_1, hash_2);

  system_->incBlockNumber();
  system_->incNonce("Bob");
  auto hash_3 = system_->finalizeBlock();
  EXPECT_NE(hash_2, hash_3);

  // repeated queries give the same value
  EXPECT_EQ(system_->getBlockHash(1), system_->getBlockHash(1));
}

/**
 * @given system pallet at genesis
 * @when blocks are finalized
 * @then genesis has no parent, a block keeps pointing to the previous block
 * number even when it is finalized twice
 */
TEST_F(SystemPalletTest, ParentBlockHash) {
  EXPECT_EQ(system_->parentBlockHash(), std::nullopt);

  auto genesis_hash = system_->finalizeBlock();
  EXPECT_EQ(system_->parentBlockHash(), std::nullopt);

  system_->incBlockNumber();
  EXPECT_EQ(system_->parentBlockHash(), genesis_hash);

  system_->finalizeBlock();
  EXPECT_EQ(system_->parentBlockHash(), genesis_hash);
}

/**
 * @given three finalized blocks
 * @when all block hashes are requested
 * @then every block number maps to the hash returned on its finalization
 */
TEST_F(SystemPalletTest, AllBlockHashes) {
  EXPECT_TRUE(system_->allBlockHashes().empty());

  auto hash_0 = system_->finalizeBlock();
  system_->incBlockNumber();
  auto hash_1 = system_->finalizeBlock();
  system_->incBlockNumber();
  auto hash_2 = system_->finalizeBlock();
  system_->incBlockNumber();

  const auto &all_hashes = system_->allBlockHashes();
  ASSERT_EQ(all_hashes.size(), 3);
  EXPECT_EQ(all_hashes.at(0), hash_0);
  EXPECT_EQ(all_hashes.at(1), hash_1);
  EXPECT_EQ(all_hashes.at(2), hash_2);
  EXPECT_EQ(system_->currentBlockHash(), std::nullopt);
}

/**
 * @given block 2 with nonces 2 and 1, on top of finalized block 1
 * @when block 2 is finalized
 * @then hash carries the block number and nonce sum big-endian, the parent
 * hash prefix and the number-derived filler
 */
TEST_F(SystemPalletTest, HashLayout) {
  system_->incBlockNumber();
  auto block_1_hash = system_->finalizeBlock();

  system_->incBlockNumber();
  system_->incNonce("Alice");
  system_->incNonce("Alice");
  system_->incNonce("Bob");
  auto hash = system_->finalizeBlock();

  const std::array<uint8_t, 8> prefix{0, 0, 0, 2, 0, 0, 0, 3};
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), hash.begin()));
  EXPECT_TRUE(std::equal(
      block_1_hash.begin(), block_1_hash.begin() + 8, hash.begin() + 8));
  for (size_t i = 16; i < hash.size(); ++i) {
    EXPECT_EQ(hash[i], (i + 2) % 256) << "byte " << i;
  }
}

/**
 * @given block number at the maximum of its type
 * @when it is incremented
 * @then it stays at the maximum
 */
TEST(SystemPalletSaturationTest, BlockNumberSaturates) {
  testutil::prepareLoggers();

  struct TinyBlocks {
    using AccountId = std::string;
    using BlockNumber = uint8_t;
    using Nonce = uint8_t;
  };
  minichain::system::Pallet<TinyBlocks> system;
  for (int i = 0; i < 300; ++i) {
    system.incBlockNumber();
    system.incNonce("Alice");
  }
  EXPECT_EQ(system.blockNumber(), 255);
  EXPECT_EQ(system.nonce("Alice"), 255);
}
