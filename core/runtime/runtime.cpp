/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/runtime.hpp"

#include <limits>

#include "common/visitor.hpp"
#include "runtime/runtime_error.hpp"

namespace minichain::runtime {

  Runtime::Runtime() : Runtime({}, {}) {}

  Runtime::Runtime(balances::FeeConfig<RuntimeConfig> fee_config,
                   staking::Parameters<RuntimeConfig> staking_parameters)
      : balances_{std::move(fee_config)},
        staking_{std::move(staking_parameters)} {}

  primitives::DispatchResult Runtime::dispatch(const AccountId &caller,
                                               RuntimeCall call) {
    return visit_in_place(
        std::move(call),
        [&](balances::Call<RuntimeConfig> &&balances_call) {
          return balances_.dispatch(caller, std::move(balances_call));
        },
        [&](staking::Call<RuntimeConfig> &&staking_call) {
          return dispatchStaking(caller, std::move(staking_call));
        });
  }

  primitives::DispatchResult Runtime::dispatchStaking(
      const AccountId &caller, staking::Call<RuntimeConfig> call) {
    auto dispatcher = staking_.dispatcher(
        [this](const AccountId &who) { return balances_.balance(who); },
        creditCheck());
    OUTCOME_TRY(dispatcher.dispatch(caller, std::move(call)));

    const auto &settlement = dispatcher.settlement();
    if (settlement.locked != math::zero<Balance>()) {
      OUTCOME_TRY(balances_.withdraw(caller, settlement.locked));
    }
    if (settlement.unlocked != math::zero<Balance>()) {
      OUTCOME_TRY(balances_.deposit(caller, settlement.unlocked));
    }
    if (settlement.rewards != math::zero<Balance>()) {
      OUTCOME_TRY(balances_.deposit(caller, settlement.rewards));
    }
    return outcome::success();
  }

  Runtime::StakingPallet::CreditCheck Runtime::creditCheck() const {
    return [this](const AccountId &who, const Balance &amount) {
      return balances_.checkDeposit(who, amount);
    };
  }

  outcome::result<void> Runtime::applyGenesis(const GenesisConfig &genesis) {
    for (const auto &[who, amount] : genesis.balances) {
      balances_.setBalance(who, amount);
    }
    balances_.setTransactionFee(genesis.base_fee);
    balances_.setFeeRecipient(genesis.fee_recipient);

    for (const auto &validator : genesis.validators) {
      OUTCOME_TRY(staking_.addValidator(validator.id, validator.commission));
    }

    auto genesis_hash = system_.finalizeBlock();
    has_genesis_ = true;
    SL_INFO(logger_,
            "Genesis applied: {} accounts, {} validators, hash {:l}",
            genesis.balances.size(),
            genesis.validators.size(),
            genesis_hash);
    return outcome::success();
  }

  outcome::result<BlockResult> Runtime::executeBlock(const Block &block) {
    const auto expected = math::sat_add_unsigned(system_.blockNumber(),
                                                 math::one<BlockNumber>());
    if (block.header.block_number != expected) {
      SL_WARN(logger_,
              "Block #{} rejected, expected #{}",
              block.header.block_number,
              expected);
      return RuntimeError::BLOCK_NUMBER_MISMATCH;
    }

    system_.incBlockNumber();
    const auto block_number = system_.blockNumber();

    BlockResult result{
        .block_number = block_number,
        .block_hash = {},
        .successful = {},
        .failed = {},
    };

    primitives::ExtrinsicIndex index = 0;
    for (const auto &extrinsic : block.extrinsics) {
      system_.incNonce(extrinsic.caller);
      auto res = dispatch(extrinsic.caller, extrinsic.call);
      if (res.has_value()) {
        SL_TRACE(logger_,
                 "Extrinsic #{} of block #{} by {} applied",
                 index,
                 block_number,
                 extrinsic.caller);
        result.successful.push_back(index);
      } else {
        SL_WARN(logger_,
                "Extrinsic #{} of block #{} by {} failed: {}",
                index,
                block_number,
                extrinsic.caller,
                res.error());
        result.failed.push_back({index, res.error()});
      }
      ++index;
    }

    result.block_hash = system_.finalizeBlock();
    depositPayouts(staking_.onBlock(block_number, creditCheck()));

    SL_INFO(logger_,
            "Block #{} executed: {} succeeded, {} failed, hash {}",
            block_number,
            result.successful.size(),
            result.failed.size(),
            result.block_hash);
    return result;
  }

  outcome::result<BlockResult> Runtime::createBlock(
      const std::vector<Transaction> &transactions) {
    Block block{
        .header = {.block_number = math::sat_add_unsigned(
                       system_.blockNumber(), math::one<BlockNumber>())},
        .extrinsics = {},
    };
    block.extrinsics.reserve(transactions.size());
    for (const auto &transaction : transactions) {
      block.extrinsics.push_back(toExtrinsic(transaction));
    }
    return executeBlock(block);
  }

  primitives::DispatchResult Runtime::executeTransaction(
      const Transaction &transaction) {
    auto extrinsic = toExtrinsic(transaction);
    system_.incNonce(extrinsic.caller);
    return dispatch(extrinsic.caller, std::move(extrinsic.call));
  }

  bool Runtime::verifyChainIntegrity() const {
    const BlockNumber first = has_genesis_ ? 0 : 1;
    for (auto number = first; number <= system_.blockNumber(); ++number) {
      if (not system_.getBlockHash(number).has_value()) {
        return false;
      }
      if (number == std::numeric_limits<BlockNumber>::max()) {
        break;
      }
    }
    return true;
  }

  void Runtime::depositPayouts(
      const std::vector<staking::RewardPayout<RuntimeConfig>> &payouts) {
    for (const auto &payout : payouts) {
      if (auto res = balances_.deposit(payout.who, payout.amount);
          res.has_error()) {
        SL_ERROR(logger_,
                 "Reward {} of {} not credited: {}",
                 payout.amount,
                 payout.who,
                 res.error());
      }
    }
  }

}  // namespace minichain::runtime
