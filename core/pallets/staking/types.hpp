/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <variant>

#include "pallets/staking/config.hpp"

namespace minichain::staking {

  /// Commission is a percentage of the nominator's reward, 0..100
  using Commission = uint8_t;
  constexpr Commission kMaxCommission = 100;

  /// Rewards are expressed in thousandths of the stake per block
  constexpr uint32_t kRewardRateScale = 1000;

  /**
   * Staking configuration, fixed for the lifetime of the pallet
   */
  template <Config T>
  struct Parameters {
    using Balance = typename T::Balance;
    using BlockNumber = typename T::BlockNumber;

    Balance minimum_stake = Balance(100u);
    /// reward per block per kRewardRateScale staked tokens
    Balance reward_rate = Balance(5u);
    /// blocks a stake stays locked after staking
    BlockNumber unstaking_period = BlockNumber(10u);
    uint32_t max_validators = 10;
  };

  template <Config T>
  struct StakeInfo {
    typename T::Balance staked_amount;
    typename T::AccountId validator;
    typename T::BlockNumber stake_block;
    typename T::BlockNumber last_reward_block;
    typename T::Balance total_rewards;

    bool operator==(const StakeInfo &) const = default;
  };

  template <Config T>
  struct ValidatorInfo {
    typename T::Balance total_stake;
    Commission commission_rate;
    bool is_active;
    uint32_t nominators_count;

    bool operator==(const ValidatorInfo &) const = default;
  };

  /// Aggregate view over the staking tables
  template <Config T>
  struct StakingStats {
    typename T::Balance total_staked;
    uint32_t total_validators;
    uint32_t active_validators;
    uint32_t total_stakers;
    typename T::Balance average_stake;
  };

  /// Reward paid to a staker by the per-block sweep
  template <Config T>
  struct RewardPayout {
    typename T::AccountId who;
    typename T::Balance amount;
  };

  namespace events {
    template <Config T>
    struct Staked {
      typename T::AccountId who;
      typename T::Balance amount;
      typename T::AccountId validator;
    };

    template <Config T>
    struct Unstaked {
      typename T::AccountId who;
      typename T::Balance amount;
    };

    template <Config T>
    struct ValidatorAdded {
      typename T::AccountId validator;
    };

    template <Config T>
    struct ValidatorRemoved {
      typename T::AccountId validator;
    };

    template <Config T>
    struct RewardsPaid {
      typename T::AccountId who;
      typename T::Balance amount;
    };

    /// Not emitted by any operation, there is no slashing
    template <Config T>
    struct SlashApplied {
      typename T::AccountId who;
      typename T::Balance amount;
    };
  }  // namespace events

  template <Config T>
  using StakingEvent = std::variant<events::Staked<T>,
                                    events::Unstaked<T>,
                                    events::ValidatorAdded<T>,
                                    events::ValidatorRemoved<T>,
                                    events::RewardsPaid<T>,
                                    events::SlashApplied<T>>;

}  // namespace minichain::staking
