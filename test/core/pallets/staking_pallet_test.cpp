/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "pallets/staking/pallet.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/pallets/test_config.hpp"
#include "testutil/prepare_loggers.hpp"

using minichain::is_type;
using minichain::staking::Parameters;
using minichain::staking::StakingError;
using testutil::TestConfig;

namespace events = minichain::staking::events;
namespace staking = minichain::staking;

using StakingPallet = staking::Pallet<TestConfig>;

class StakingPalletTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  static StakingPallet::BalanceOracle balanceCheck(uint64_t amount) {
    return [amount](const std::string &) { return amount; };
  }

  /// Checks that validator totals and the global total match the stakes
  static void expectConsistentTotals(const StakingPallet &pallet) {
    std::map<std::string, std::pair<uint64_t, uint32_t>> by_validator;
    uint64_t total = 0;
    for (const auto &[_, info] : pallet.stakes()) {
      auto &[stake, nominators] = by_validator[info.validator];
      stake += info.staked_amount;
      ++nominators;
      total += info.staked_amount;
    }
    EXPECT_EQ(pallet.totalStaked(), total);
    for (const auto &[id, info] : pallet.activeValidators()) {
      EXPECT_EQ(info.total_stake, by_validator[id].first) << id;
      EXPECT_EQ(info.nominators_count, by_validator[id].second) << id;
    }
  }

  StakingPallet staking_;
};

/**
 * @given empty validator registry
 * @when validators are added twice, with a too high commission and removed
 * @then duplicates fail with AlreadyValidator, commission above 100 fails with
 * InvalidValidator, removal unregisters the validator
 */
TEST_F(StakingPalletTest, ValidatorManagement) {
  EXPECT_OUTCOME_TRUE_1(staking_.addValidator("alice", 10));
  EXPECT_TRUE(staking_.isValidator("alice"));

  EXPECT_EC(staking_.addValidator("alice", 10), StakingError::AlreadyValidator);
  EXPECT_EC(staking_.addValidator("Bob", 150), StakingError::InvalidValidator);
  EXPECT_FALSE(staking_.isValidator("Bob"));

  EXPECT_OUTCOME_TRUE_1(staking_.removeValidator("alice"));
  EXPECT_FALSE(staking_.isValidator("alice"));
  EXPECT_EC(staking_.removeValidator("alice"), StakingError::NotValidator);
}

/**
 * @given registry limited to two validators
 * @when a third validator is added
 * @then it fails with TooManyValidators
 */
TEST(StakingPalletLimitsTest, TooManyValidators) {
  testutil::prepareLoggers();
  StakingPallet staking{Parameters<TestConfig>{.max_validators = 2}};

  EXPECT_OUTCOME_TRUE_1(staking.addValidator("v1", 0));
  EXPECT_OUTCOME_TRUE_1(staking.addValidator("v2", 100));
  EXPECT_EC(staking.addValidator("v3", 5), StakingError::TooManyValidators);
  EXPECT_EC(staking.addValidator("v1", 5), StakingError::AlreadyValidator);
}

/**
 * @given validator v1 with commission 5
 * @when u1 stakes 200 and then stakes again
 * @then first stake succeeds and is accounted, second fails with AlreadyStaked
 */
TEST_F(StakingPalletTest, Stake) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 5));

  EXPECT_OUTCOME_TRUE_1(staking_.stake("u1", 200, "v1", balanceCheck(1000)));
  EXPECT_TRUE(staking_.isStaking("u1"));
  EXPECT_EQ(staking_.totalStaked(), 200);

  auto validator = staking_.getValidatorInfo("v1");
  ASSERT_TRUE(validator.has_value());
  EXPECT_EQ(validator->total_stake, 200);
  EXPECT_EQ(validator->nominators_count, 1);

  auto stake_info = staking_.getStakeInfo("u1");
  ASSERT_TRUE(stake_info.has_value());
  EXPECT_EQ(stake_info->validator, "v1");
  EXPECT_EQ(stake_info->stake_block, 0);
  EXPECT_EQ(stake_info->total_rewards, 0);

  EXPECT_EC(staking_.stake("u1", 100, "v1", balanceCheck(1000)),
            StakingError::AlreadyStaked);
  EXPECT_EQ(staking_.totalStaked(), 200);
}

/**
 * @given validator v1
 * @when stakes below the minimum, above the available balance or to unknown
 * validators are made
 * @then they fail with the matching error and nothing is staked
 */
TEST_F(StakingPalletTest, StakeRejected) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 10));

  EXPECT_EC(staking_.stake("u1", 80, "v1", balanceCheck(1000)),
            StakingError::MinimumStakeNotMet);
  EXPECT_EC(staking_.stake("u1", 300, "v1", balanceCheck(100)),
            StakingError::InsufficientBalance);
  EXPECT_EC(staking_.stake("u1", 300, "nobody", balanceCheck(1000)),
            StakingError::InvalidValidator);

  EXPECT_FALSE(staking_.isStaking("u1"));
  EXPECT_EQ(staking_.totalStaked(), 0);
  expectConsistentTotals(staking_);
}

/**
 * @given u1 staking 200 with v1 at block 0
 * @when u1 unstakes right away and after the unstaking period
 * @then first attempt fails with UnstakingPeriodNotMet, second frees the stake
 */
TEST_F(StakingPalletTest, Unstake) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 5));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u1", 200, "v1", balanceCheck(1000)));
  EXPECT_EQ(staking_.totalStaked(), 200);

  EXPECT_EC(staking_.unstake("u1"), StakingError::UnstakingPeriodNotMet);

  staking_.onBlock(staking_.currentBlock()
                   + staking_.parameters().unstaking_period - 1);
  EXPECT_EC(staking_.unstake("u1"), StakingError::UnstakingPeriodNotMet);

  staking_.onBlock(staking_.parameters().unstaking_period);
  EXPECT_OUTCOME_TRUE(freed, staking_.unstake("u1"));
  EXPECT_EQ(freed, 200);
  EXPECT_FALSE(staking_.isStaking("u1"));
  EXPECT_EQ(staking_.totalStaked(), 0);
  EXPECT_EQ(staking_.getValidatorInfo("v1")->total_stake, 0);
  EXPECT_EQ(staking_.getValidatorInfo("v1")->nominators_count, 0);

  EXPECT_EC(staking_.unstake("u1"), StakingError::NotStaked);
}

/**
 * @given two validators, u1 staking 200 and u2 staking 850 with v1
 * @when stats are requested
 * @then they are computed from the current stakes
 */
TEST_F(StakingPalletTest, StakingStats) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 10));
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v2", 5));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u1", 200, "v1", balanceCheck(1000)));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u2", 850, "v1", balanceCheck(1000)));

  auto stats = staking_.getStakingStats();
  EXPECT_EQ(stats.total_staked, 1050);
  EXPECT_EQ(stats.total_validators, 2);
  EXPECT_EQ(stats.active_validators, 2);
  EXPECT_EQ(stats.total_stakers, 2);
  EXPECT_EQ(stats.average_stake, 525);

  staking_.onBlock(10);
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.unstake("u2"));
  stats = staking_.getStakingStats();
  EXPECT_EQ(stats.total_staked, 200);
  EXPECT_EQ(stats.total_stakers, 1);
  EXPECT_EQ(stats.average_stake, 200);
}

/**
 * @given no stakers
 * @when stats are requested
 * @then average stake is zero
 */
TEST_F(StakingPalletTest, EmptyStats) {
  auto stats = staking_.getStakingStats();
  EXPECT_EQ(stats.total_staked, 0);
  EXPECT_EQ(stats.total_stakers, 0);
  EXPECT_EQ(stats.average_stake, 0);
}

/**
 * @given u1 staking 1000 with a validator charging 10% commission
 * @when 10 blocks pass
 * @then reward is 1000 * 5 * 10 / 1000 = 50 minus 5 of commission, claiming
 * restarts accrual
 */
TEST_F(StakingPalletTest, RewardsWithCommission) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 10));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u1", 1000, "v1", balanceCheck(1000)));

  EXPECT_OUTCOME_TRUE(nothing_yet, staking_.calculateRewards("u1"));
  EXPECT_EQ(nothing_yet, 0);

  auto payouts = staking_.onBlock(10);
  ASSERT_EQ(payouts.size(), 1);
  EXPECT_EQ(payouts[0].who, "u1");
  EXPECT_EQ(payouts[0].amount, 45);

  auto stake_info = staking_.getStakeInfo("u1");
  EXPECT_EQ(stake_info->last_reward_block, 10);
  EXPECT_EQ(stake_info->total_rewards, 45);

  EXPECT_OUTCOME_TRUE(after_claim, staking_.calculateRewards("u1"));
  EXPECT_EQ(after_claim, 0);

  EXPECT_EC(staking_.calculateRewards("u2"), StakingError::NotStaked);
  EXPECT_EC(staking_.claimRewards("u2"), StakingError::NotStaked);
}

/**
 * @given stakes with validators of different commission
 * @when the per-block sweep runs
 * @then each staker gets the reward net of its validator's commission, zero
 * rewards are not reported as payouts
 */
TEST_F(StakingPalletTest, SweepNetOfCommission) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("greedy", 100));
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("free", 0));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u1", 400, "greedy", balanceCheck(1000)));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u2", 400, "free", balanceCheck(1000)));

  // 400 * 5 * 20 / 1000 = 40
  staking_.onBlock(0);
  staking_.clearEvents();
  EXPECT_OUTCOME_TRUE(u1_reward, staking_.calculateRewards("u1"));
  EXPECT_EQ(u1_reward, 0);

  auto payouts = staking_.onBlock(20);
  ASSERT_EQ(payouts.size(), 1);
  EXPECT_EQ(payouts[0].who, "u2");
  EXPECT_EQ(payouts[0].amount, 40);
  EXPECT_EQ(staking_.getStakeInfo("u1")->last_reward_block, 20);
}

/**
 * @given u1 staking with v1 which is then removed
 * @when rewards are computed, the sweep runs and u1 unstakes
 * @then rewards fail with InvalidValidator and are skipped by the sweep, new
 * stakes are rejected, unstaking is still possible after the period
 */
TEST_F(StakingPalletTest, RemovedValidatorFreezesStakes) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 10));
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v2", 10));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u1", 500, "v1", balanceCheck(1000)));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u2", 500, "v2", balanceCheck(1000)));
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.removeValidator("v1"));

  EXPECT_EC(staking_.calculateRewards("u1"), StakingError::InvalidValidator);
  EXPECT_EC(staking_.stake("u3", 500, "v1", balanceCheck(1000)),
            StakingError::InvalidValidator);

  auto payouts = staking_.onBlock(10);
  ASSERT_EQ(payouts.size(), 1);
  EXPECT_EQ(payouts[0].who, "u2");
  EXPECT_EQ(staking_.getStakeInfo("u1")->total_rewards, 0);

  EXPECT_OUTCOME_TRUE(freed, staking_.unstake("u1"));
  EXPECT_EQ(freed, 500);
  EXPECT_EQ(staking_.totalStaked(), 500);
  expectConsistentTotals(staking_);
}

/**
 * @given several stakers spread over validators
 * @when stakes and unstakes interleave
 * @then validator totals and the global total always match the stakes
 */
TEST_F(StakingPalletTest, TotalsStayConsistent) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 5));
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v2", 15));

  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u1", 100, "v1", balanceCheck(1000)));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u2", 250, "v1", balanceCheck(1000)));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u3", 700, "v2", balanceCheck(1000)));
  expectConsistentTotals(staking_);

  staking_.onBlock(12);
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.unstake("u2"));
  expectConsistentTotals(staking_);

  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u2", 300, "v2", balanceCheck(1000)));
  EXPECT_EC(staking_.unstake("u2"), StakingError::UnstakingPeriodNotMet);
  expectConsistentTotals(staking_);
  EXPECT_EQ(staking_.totalStaked(), 1100);
}

/**
 * @given a sequence of staking operations
 * @when events are taken
 * @then they are reported in order and the queue is drained
 */
TEST_F(StakingPalletTest, Events) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 0));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u1", 1000, "v1", balanceCheck(1000)));
  staking_.onBlock(10);
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.unstake("u1"));
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.removeValidator("v1"));

  auto emitted = staking_.takeEvents();
  ASSERT_EQ(emitted.size(), 5);
  EXPECT_TRUE(is_type<events::ValidatorAdded<TestConfig>>(emitted[0]));
  ASSERT_TRUE(is_type<events::Staked<TestConfig>>(emitted[1]));
  EXPECT_EQ(std::get<events::Staked<TestConfig>>(emitted[1]).amount, 1000);
  ASSERT_TRUE(is_type<events::RewardsPaid<TestConfig>>(emitted[2]));
  EXPECT_EQ(std::get<events::RewardsPaid<TestConfig>>(emitted[2]).amount, 50);
  EXPECT_TRUE(is_type<events::Unstaked<TestConfig>>(emitted[3]));
  EXPECT_TRUE(is_type<events::ValidatorRemoved<TestConfig>>(emitted[4]));

  EXPECT_TRUE(staking_.events().empty());
}

/**
 * @given stake overflowing the validator total
 * @when it is staked
 * @then it fails with RewardCalculationError and nothing changes
 */
TEST(StakingPalletOverflowTest, StakeOverflow) {
  testutil::prepareLoggers();
  using testutil::NarrowConfig;
  staking::Pallet<NarrowConfig> pallet{
      Parameters<NarrowConfig>{.minimum_stake = 100}};
  auto oracle = [](const std::string &) -> uint8_t { return 255; };

  ASSERT_OUTCOME_SUCCESS_TRY(pallet.addValidator("v1", 0));
  ASSERT_OUTCOME_SUCCESS_TRY(pallet.stake("u1", 200, "v1", oracle));
  EXPECT_EC(pallet.stake("u2", 100, "v1", oracle),
            StakingError::RewardCalculationError);
  EXPECT_FALSE(pallet.isStaking("u2"));
  EXPECT_EQ(pallet.totalStaked(), 200);

  // 200 * 5 overflows uint8_t
  pallet.onBlock(1);
  EXPECT_EC(pallet.calculateRewards("u1"),
            StakingError::RewardCalculationError);
}

/**
 * @given stake on a chain whose balances are narrower than block numbers
 * @when more blocks elapse than a balance can count
 * @then the reward fails with RewardCalculationError instead of being
 * computed from a truncated block count, and the sweep leaves the stake as is
 */
TEST(StakingPalletOverflowTest, ElapsedBlocksOverflow) {
  testutil::prepareLoggers();
  using testutil::NarrowConfig;
  staking::Pallet<NarrowConfig> pallet{Parameters<NarrowConfig>{
      .minimum_stake = 1, .reward_rate = 1}};
  auto oracle = [](const std::string &) -> uint8_t { return 255; };

  ASSERT_OUTCOME_SUCCESS_TRY(pallet.addValidator("v1", 0));
  ASSERT_OUTCOME_SUCCESS_TRY(pallet.stake("u1", 1, "v1", oracle));

  EXPECT_TRUE(pallet.onBlock(255).empty());
  EXPECT_OUTCOME_TRUE(reward, pallet.calculateRewards("u1"));
  EXPECT_EQ(reward, 0);

  // 300 blocks elapsed since the last payout do not fit uint8_t
  EXPECT_TRUE(pallet.onBlock(555).empty());
  EXPECT_EC(pallet.calculateRewards("u1"),
            StakingError::RewardCalculationError);
  EXPECT_EQ(pallet.getStakeInfo("u1")->last_reward_block, 255);
}

/**
 * @given unlocked stake with accrued rewards
 * @when the freed funds or the rewards can not be credited
 * @then unstake, claim and sweep fail or skip without changing the stake
 */
TEST_F(StakingPalletTest, RejectedCredit) {
  ASSERT_OUTCOME_SUCCESS_TRY(staking_.addValidator("v1", 0));
  ASSERT_OUTCOME_SUCCESS_TRY(
      staking_.stake("u1", 1000, "v1", balanceCheck(1000)));
  StakingPallet::CreditCheck reject =
      [](const std::string &, const uint64_t &) -> outcome::result<void> {
    return StakingError::RewardCalculationError;
  };

  EXPECT_TRUE(staking_.onBlock(10, reject).empty());
  EXPECT_EC(staking_.claimRewards("u1", reject),
            StakingError::RewardCalculationError);
  EXPECT_EC(staking_.unstake("u1", reject),
            StakingError::RewardCalculationError);

  ASSERT_TRUE(staking_.isStaking("u1"));
  EXPECT_EQ(staking_.getStakeInfo("u1")->last_reward_block, 0);
  EXPECT_EQ(staking_.getStakeInfo("u1")->total_rewards, 0);
  EXPECT_EQ(staking_.totalStaked(), 1000);
  EXPECT_EQ(staking_.getValidatorInfo("v1")->nominators_count, 1);
  expectConsistentTotals(staking_);

  // 1000 * 5 * 10 / 1000
  EXPECT_OUTCOME_TRUE(reward, staking_.claimRewards("u1"));
  EXPECT_EQ(reward, 50);
}

/**
 * @given dispatcher built with a balance oracle
 * @when staking calls are dispatched
 * @then they are applied on behalf of the caller and the moved funds are
 * reported in the settlement
 */
TEST_F(StakingPalletTest, DispatchCalls) {
  using Call = staking::Call<TestConfig>;

  {
    auto dispatcher = staking_.dispatcher(balanceCheck(1000));
    EXPECT_OUTCOME_TRUE_1(
        dispatcher.dispatch("v1", Call{staking::AddValidator<TestConfig>{7}}));
    EXPECT_EQ(dispatcher.settlement().locked, 0);
  }
  EXPECT_EQ(staking_.getValidatorInfo("v1")->commission_rate, 7);

  {
    auto dispatcher = staking_.dispatcher(balanceCheck(1000));
    EXPECT_OUTCOME_TRUE_1(dispatcher.dispatch(
        "u1", Call{staking::Stake<TestConfig>{600, "v1"}}));
    EXPECT_EQ(dispatcher.settlement().locked, 600);
  }
  {
    auto dispatcher = staking_.dispatcher(balanceCheck(100));
    EXPECT_EC(dispatcher.dispatch(
                  "u2", Call{staking::Stake<TestConfig>{600, "v1"}}),
              StakingError::InsufficientBalance);
    EXPECT_EQ(dispatcher.settlement().locked, 0);
  }

  staking_.onBlock(10);
  {
    auto dispatcher = staking_.dispatcher(balanceCheck(0));
    EXPECT_OUTCOME_TRUE_1(
        dispatcher.dispatch("u1", Call{staking::Unstake<TestConfig>{}}));
    EXPECT_EQ(dispatcher.settlement().unlocked, 600);
  }
  {
    auto dispatcher = staking_.dispatcher(balanceCheck(0));
    EXPECT_EC(
        dispatcher.dispatch("u1", Call{staking::ClaimRewards<TestConfig>{}}),
        StakingError::NotStaked);
    EXPECT_OUTCOME_TRUE_1(dispatcher.dispatch(
        "root", Call{staking::RemoveValidator<TestConfig>{"v1"}}));
  }
  EXPECT_FALSE(staking_.isValidator("v1"));
}
