/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/transaction.hpp"

#include "common/visitor.hpp"

namespace minichain::runtime {

  using C = RuntimeConfig;

  Extrinsic toExtrinsic(const Transaction &transaction) {
    return visit_in_place(
        transaction,
        [](const transactions::Transfer &tx) {
          return Extrinsic{
              .caller = tx.from,
              .call = balances::Call<C>{balances::Transfer<C>{tx.to, tx.amount}},
          };
        },
        [](const transactions::SetBalance &tx) {
          return Extrinsic{
              .caller = tx.who,
              .call =
                  balances::Call<C>{balances::SetBalance<C>{tx.who, tx.amount}},
          };
        },
        [](const transactions::AddValidator &tx) {
          return Extrinsic{
              .caller = tx.validator,
              .call =
                  staking::Call<C>{staking::AddValidator<C>{tx.commission}},
          };
        },
        [](const transactions::Stake &tx) {
          return Extrinsic{
              .caller = tx.who,
              .call = staking::Call<C>{
                  staking::Stake<C>{tx.amount, tx.validator}},
          };
        },
        [](const transactions::Unstake &tx) {
          return Extrinsic{
              .caller = tx.who,
              .call = staking::Call<C>{staking::Unstake<C>{}},
          };
        },
        [](const transactions::ClaimRewards &tx) {
          return Extrinsic{
              .caller = tx.who,
              .call = staking::Call<C>{staking::ClaimRewards<C>{}},
          };
        });
  }

}  // namespace minichain::runtime
