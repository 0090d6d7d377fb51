/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "common/visitor.hpp"
#include "log/logger.hpp"
#include "pallets/staking/calls.hpp"
#include "pallets/staking/staking_error.hpp"
#include "pallets/staking/types.hpp"
#include "primitives/dispatch.hpp"

namespace minichain::staking {

  template <Config T>
  class CallDispatcher;

  /**
   * Validator registry and nominator stakes with block-based rewards.
   *
   * The pallet only tracks that funds are locked. Moving the staked amount,
   * the freed amount and the rewards between spendable balances is up to the
   * caller; the spendable balance is read through a BalanceOracle supplied
   * per call.
   */
  template <Config T>
  class Pallet {
   public:
    using AccountId = typename T::AccountId;
    using Balance = typename T::Balance;
    using BlockNumber = typename T::BlockNumber;
    using Event = StakingEvent<T>;

    /// Read-only view of spendable balances
    using BalanceOracle = std::function<Balance(const AccountId &)>;

    /// Fails if the amount can not be credited to the spendable balance
    using CreditCheck = std::function<outcome::result<void>(const AccountId &,
                                                            const Balance &)>;

    Pallet() = default;

    explicit Pallet(Parameters<T> parameters)
        : parameters_{std::move(parameters)} {}

    /**
     * @return dispatcher of staking calls which checks spendable balances
     * through \arg balance_check and the freed funds through \arg
     * credit_check. It refers to this pallet and must not outlive the call it
     * is built for.
     */
    CallDispatcher<T> dispatcher(BalanceOracle balance_check,
                                 CreditCheck credit_check = {}) {
      return CallDispatcher<T>{
          *this, std::move(balance_check), std::move(credit_check)};
    }

    const Parameters<T> &parameters() const {
      return parameters_;
    }

    BlockNumber currentBlock() const {
      return current_block_;
    }

    /**
     * Block hook, called once per finalized block. Updates the current block
     * and pays rewards to every staker; a staker whose reward can not be
     * computed or fails \arg credit_check is skipped and keeps accruing.
     * @return rewards paid by the sweep
     */
    std::vector<RewardPayout<T>> onBlock(const BlockNumber &block_number,
                                         const CreditCheck &credit_check = {}) {
      current_block_ = block_number;

      std::vector<AccountId> stakers;
      stakers.reserve(stakes_.size());
      for (const auto &[who, _] : stakes_) {
        stakers.push_back(who);
      }

      std::vector<RewardPayout<T>> payouts;
      for (auto &who : stakers) {
        auto res = claimRewards(who, credit_check);
        if (res.has_error()) {
          SL_VERBOSE(logger_,
                     "Rewards of {} skipped at block {}: {}",
                     who,
                     block_number,
                     res.error());
          continue;
        }
        if (res.value() != math::zero<Balance>()) {
          payouts.push_back({std::move(who), std::move(res.value())});
        }
      }
      return payouts;
    }

    outcome::result<void> addValidator(const AccountId &validator,
                                       Commission commission_rate) {
      if (validators_.contains(validator)) {
        return StakingError::AlreadyValidator;
      }
      if (validators_.size() >= parameters_.max_validators) {
        return StakingError::TooManyValidators;
      }
      if (commission_rate > kMaxCommission) {
        return StakingError::InvalidValidator;
      }

      validators_.emplace(validator,
                          ValidatorInfo<T>{
                              .total_stake = math::zero<Balance>(),
                              .commission_rate = commission_rate,
                              .is_active = true,
                              .nominators_count = 0,
                          });
      SL_DEBUG(logger_,
               "Validator {} added with commission {}%",
               validator,
               commission_rate);
      events_.emplace_back(events::ValidatorAdded<T>{validator});
      return outcome::success();
    }

    /**
     * Unregisters \arg validator. Stakes of its nominators stay in place: they
     * earn no rewards and can still be unstaked once unlocked.
     */
    outcome::result<void> removeValidator(const AccountId &validator) {
      auto it = validators_.find(validator);
      if (it == validators_.end()) {
        return StakingError::NotValidator;
      }
      if (it->second.nominators_count != 0) {
        SL_WARN(logger_,
                "Validator {} removed with {} nominators still staking",
                validator,
                it->second.nominators_count);
      }
      validators_.erase(it);
      events_.emplace_back(events::ValidatorRemoved<T>{validator});
      return outcome::success();
    }

    /**
     * Locks \arg amount of \arg who behind \arg validator. Debiting the
     * spendable balance is the caller's responsibility.
     */
    outcome::result<void> stake(const AccountId &who,
                                const Balance &amount,
                                const AccountId &validator,
                                const BalanceOracle &balance_check) {
      if (stakes_.contains(who)) {
        return StakingError::AlreadyStaked;
      }
      if (amount < parameters_.minimum_stake) {
        return StakingError::MinimumStakeNotMet;
      }

      auto validator_it = validators_.find(validator);
      if (validator_it == validators_.end()
          or not validator_it->second.is_active) {
        return StakingError::InvalidValidator;
      }

      if (balance_check(who) < amount) {
        return StakingError::InsufficientBalance;
      }

      auto &validator_info = validator_it->second;
      OUTCOME_TRY(validator_stake,
                  math::checked_add(validator_info.total_stake,
                                    amount,
                                    StakingError::RewardCalculationError));
      OUTCOME_TRY(nominators_count,
                  math::checked_add(validator_info.nominators_count,
                                    1u,
                                    StakingError::RewardCalculationError));
      OUTCOME_TRY(total_staked,
                  math::checked_add(total_staked_,
                                    amount,
                                    StakingError::RewardCalculationError));

      validator_info.total_stake = std::move(validator_stake);
      validator_info.nominators_count = nominators_count;
      total_staked_ = std::move(total_staked);
      stakes_.emplace(who,
                      StakeInfo<T>{
                          .staked_amount = amount,
                          .validator = validator,
                          .stake_block = current_block_,
                          .last_reward_block = current_block_,
                          .total_rewards = math::zero<Balance>(),
                      });

      SL_DEBUG(logger_,
               "{} staked {} with validator {} at block {}",
               who,
               amount,
               validator,
               current_block_);
      events_.emplace_back(events::Staked<T>{who, amount, validator});
      return outcome::success();
    }

    /**
     * Releases the stake of \arg who once the unstaking period has passed.
     * Nothing changes unless \arg credit_check accepts the freed amount.
     * @return freed amount, to be credited back by the caller
     */
    outcome::result<Balance> unstake(const AccountId &who,
                                     const CreditCheck &credit_check = {}) {
      auto stake_it = stakes_.find(who);
      if (stake_it == stakes_.end()) {
        return StakingError::NotStaked;
      }
      const auto &stake_info = stake_it->second;

      const auto unlock_block = math::sat_add_unsigned(
          stake_info.stake_block, parameters_.unstaking_period);
      if (current_block_ < unlock_block) {
        return StakingError::UnstakingPeriodNotMet;
      }

      const auto staked_amount = stake_info.staked_amount;
      OUTCOME_TRY(total_staked,
                  math::checked_sub(total_staked_,
                                    staked_amount,
                                    StakingError::RewardCalculationError));
      if (credit_check) {
        OUTCOME_TRY(credit_check(who, staked_amount));
      }

      // the validator may have been removed meanwhile
      auto validator_it = validators_.find(stake_info.validator);
      if (validator_it != validators_.end()) {
        auto &validator_info = validator_it->second;
        OUTCOME_TRY(validator_stake,
                    math::checked_sub(validator_info.total_stake,
                                      staked_amount,
                                      StakingError::RewardCalculationError));
        validator_info.total_stake = std::move(validator_stake);
        validator_info.nominators_count =
            math::sat_sub_unsigned(validator_info.nominators_count, 1u);
      }

      total_staked_ = std::move(total_staked);
      stakes_.erase(stake_it);

      SL_DEBUG(logger_, "{} unstaked {}", who, staked_amount);
      events_.emplace_back(events::Unstaked<T>{who, staked_amount});
      return staked_amount;
    }

    /**
     * Reward accrued by \arg who since the last claim:
     * staked * reward_rate * blocks / 1000, minus the validator commission
     */
    outcome::result<Balance> calculateRewards(const AccountId &who) const {
      auto stake_it = stakes_.find(who);
      if (stake_it == stakes_.end()) {
        return StakingError::NotStaked;
      }
      const auto &stake_info = stake_it->second;

      auto validator_it = validators_.find(stake_info.validator);
      if (validator_it == validators_.end()) {
        return StakingError::InvalidValidator;
      }

      OUTCOME_TRY(blocks,
                  math::checked_cast<Balance>(
                      math::sat_sub_unsigned(current_block_,
                                             stake_info.last_reward_block),
                      StakingError::RewardCalculationError));

      OUTCOME_TRY(per_block,
                  math::checked_mul(stake_info.staked_amount,
                                    parameters_.reward_rate,
                                    StakingError::RewardCalculationError));
      OUTCOME_TRY(scaled,
                  math::checked_mul(per_block,
                                    blocks,
                                    StakingError::RewardCalculationError));
      const Balance base_reward = scaled / Balance(kRewardRateScale);

      OUTCOME_TRY(commission_scaled,
                  math::checked_mul(
                      base_reward,
                      Balance(validator_it->second.commission_rate),
                      StakingError::RewardCalculationError));
      const Balance commission = commission_scaled / Balance(100u);

      return math::checked_sub(
          base_reward, commission, StakingError::RewardCalculationError);
    }

    /**
     * Pays out the accrued reward of \arg who and restarts accrual from the
     * current block, unless \arg credit_check rejects the reward.
     * @return paid amount, to be credited by the caller
     */
    outcome::result<Balance> claimRewards(
        const AccountId &who, const CreditCheck &credit_check = {}) {
      OUTCOME_TRY(reward, calculateRewards(who));
      if (credit_check) {
        OUTCOME_TRY(credit_check(who, reward));
      }

      auto &stake_info = stakes_.at(who);
      OUTCOME_TRY(total_rewards,
                  math::checked_add(stake_info.total_rewards,
                                    reward,
                                    StakingError::RewardCalculationError));
      stake_info.last_reward_block = current_block_;
      stake_info.total_rewards = std::move(total_rewards);

      SL_TRACE(
          logger_, "{} claimed {} at block {}", who, reward, current_block_);
      events_.emplace_back(events::RewardsPaid<T>{who, reward});
      return reward;
    }

    std::optional<StakeInfo<T>> getStakeInfo(const AccountId &who) const {
      if (auto it = stakes_.find(who); it != stakes_.end()) {
        return it->second;
      }
      return std::nullopt;
    }

    std::optional<ValidatorInfo<T>> getValidatorInfo(
        const AccountId &validator) const {
      if (auto it = validators_.find(validator); it != validators_.end()) {
        return it->second;
      }
      return std::nullopt;
    }

    std::vector<std::pair<AccountId, ValidatorInfo<T>>> activeValidators()
        const {
      std::vector<std::pair<AccountId, ValidatorInfo<T>>> active;
      for (const auto &[id, info] : validators_) {
        if (info.is_active) {
          active.emplace_back(id, info);
        }
      }
      return active;
    }

    const std::map<AccountId, StakeInfo<T>> &stakes() const {
      return stakes_;
    }

    const Balance &totalStaked() const {
      return total_staked_;
    }

    bool isStaking(const AccountId &who) const {
      return stakes_.contains(who);
    }

    bool isValidator(const AccountId &who) const {
      return validators_.contains(who);
    }

    const std::vector<Event> &events() const {
      return events_;
    }

    void clearEvents() {
      events_.clear();
    }

    /// Drains the event queue
    std::vector<Event> takeEvents() {
      return std::exchange(events_, {});
    }

    /// Computed from the current tables on every call
    StakingStats<T> getStakingStats() const {
      auto total = math::zero<Balance>();
      for (const auto &[_, stake_info] : stakes_) {
        total = math::sat_add_unsigned(total, stake_info.staked_amount);
      }
      const auto total_stakers = static_cast<uint32_t>(stakes_.size());
      const auto average = total_stakers > 0
                             ? Balance(total / Balance(total_stakers))
                             : math::zero<Balance>();

      return StakingStats<T>{
          .total_staked = total,
          .total_validators = static_cast<uint32_t>(validators_.size()),
          .active_validators = static_cast<uint32_t>(activeValidators().size()),
          .total_stakers = total_stakers,
          .average_stake = average,
      };
    }

   private:
    Parameters<T> parameters_;

    std::map<AccountId, StakeInfo<T>> stakes_;
    std::map<AccountId, ValidatorInfo<T>> validators_;

    Balance total_staked_ = math::zero<Balance>();
    BlockNumber current_block_ = math::zero<BlockNumber>();
    std::vector<Event> events_;

    log::Logger logger_ = log::createLogger("Staking", "staking");
  };

  /**
   * Funds a dispatched call moved in or out of the lock. The pallet never
   * touches spendable balances, the owner of the ledger applies these.
   */
  template <Config T>
  struct Settlement {
    using Balance = typename T::Balance;

    Balance locked = math::zero<Balance>();
    Balance unlocked = math::zero<Balance>();
    Balance rewards = math::zero<Balance>();
  };

  template <Config T>
  class CallDispatcher
      : public primitives::Dispatch<typename T::AccountId, Call<T>> {
   public:
    using AccountId = typename T::AccountId;
    using BalanceOracle = typename Pallet<T>::BalanceOracle;
    using CreditCheck = typename Pallet<T>::CreditCheck;

    CallDispatcher(Pallet<T> &pallet,
                   BalanceOracle balance_check,
                   CreditCheck credit_check)
        : pallet_{pallet},
          balance_check_{std::move(balance_check)},
          credit_check_{std::move(credit_check)} {}

    primitives::DispatchResult dispatch(const AccountId &caller,
                                        Call<T> call) override {
      return visit_in_place(
          call,
          [&](const AddValidator<T> &add) -> primitives::DispatchResult {
            return pallet_.addValidator(caller, add.commission);
          },
          [&](const RemoveValidator<T> &remove) -> primitives::DispatchResult {
            return pallet_.removeValidator(remove.validator);
          },
          [&](const Stake<T> &stake) -> primitives::DispatchResult {
            OUTCOME_TRY(pallet_.stake(
                caller, stake.amount, stake.validator, balance_check_));
            settlement_.locked = stake.amount;
            return outcome::success();
          },
          [&](const Unstake<T> &) -> primitives::DispatchResult {
            OUTCOME_TRY(amount, pallet_.unstake(caller, credit_check_));
            settlement_.unlocked = std::move(amount);
            return outcome::success();
          },
          [&](const ClaimRewards<T> &) -> primitives::DispatchResult {
            OUTCOME_TRY(reward, pallet_.claimRewards(caller, credit_check_));
            settlement_.rewards = std::move(reward);
            return outcome::success();
          });
    }

    /// Funds to move after a successful dispatch
    const Settlement<T> &settlement() const {
      return settlement_;
    }

   private:
    Pallet<T> &pallet_;
    BalanceOracle balance_check_;
    CreditCheck credit_check_;
    Settlement<T> settlement_;
  };

}  // namespace minichain::staking
