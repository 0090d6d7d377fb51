/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "log/logger.hpp"
#include "pallets/balances/pallet.hpp"
#include "pallets/staking/pallet.hpp"
#include "pallets/system/pallet.hpp"
#include "primitives/dispatch.hpp"
#include "runtime/block_result.hpp"
#include "runtime/genesis_config.hpp"
#include "runtime/runtime_call.hpp"
#include "runtime/transaction.hpp"

namespace minichain::runtime {

  /**
   * Composition of the system, balances and staking pallets. Owns the whole
   * chain state and is its only mutator.
   */
  class Runtime : public primitives::Dispatch<AccountId, RuntimeCall> {
   public:
    using SystemPallet = system::Pallet<RuntimeConfig>;
    using BalancesPallet = balances::Pallet<RuntimeConfig>;
    using StakingPallet = staking::Pallet<RuntimeConfig>;

    Runtime();
    Runtime(balances::FeeConfig<RuntimeConfig> fee_config,
            staking::Parameters<RuntimeConfig> staking_parameters);

    ~Runtime() override = default;

    /**
     * Routes \arg call to the pallet it belongs to. Funds locked, unlocked or
     * paid out by staking calls are moved on the balances ledger.
     */
    primitives::DispatchResult dispatch(const AccountId &caller,
                                        RuntimeCall call) override;

    /**
     * Sets initial balances, the fee configuration and genesis validators,
     * then finalizes block 0
     */
    outcome::result<void> applyGenesis(const GenesisConfig &genesis);

    /**
     * Executes extrinsics of \arg block in order. A failed extrinsic is
     * recorded and skipped, its caller's nonce is incremented anyway.
     * @return error if the block does not follow the current one, otherwise
     * hash of the finalized block and per-extrinsic outcome
     */
    outcome::result<BlockResult> executeBlock(const Block &block);

    /// Builds the next block out of \arg transactions and executes it
    outcome::result<BlockResult> createBlock(
        const std::vector<Transaction> &transactions);

    /**
     * Applies a single transaction outside of any block: increments the
     * signer's nonce and dispatches the call
     */
    primitives::DispatchResult executeTransaction(
        const Transaction &transaction);

    /// @return true if every block up to the current one has a hash stored
    bool verifyChainIntegrity() const;

    BlockNumber blockNumber() const {
      return system_.blockNumber();
    }

    const SystemPallet &system() const {
      return system_;
    }

    SystemPallet &system() {
      return system_;
    }

    const BalancesPallet &balances() const {
      return balances_;
    }

    BalancesPallet &balances() {
      return balances_;
    }

    const StakingPallet &staking() const {
      return staking_;
    }

    StakingPallet &staking() {
      return staking_;
    }

   private:
    primitives::DispatchResult dispatchStaking(
        const AccountId &caller, staking::Call<RuntimeConfig> call);

    /// Staking releases funds only if the balances ledger can take them
    StakingPallet::CreditCheck creditCheck() const;

    /// Credits rewards reported by the staking block hook
    void depositPayouts(
        const std::vector<staking::RewardPayout<RuntimeConfig>> &payouts);

    SystemPallet system_;
    BalancesPallet balances_;
    StakingPallet staking_;
    bool has_genesis_ = false;

    log::Logger logger_ = log::createLogger("Runtime", "runtime");
  };

}  // namespace minichain::runtime
