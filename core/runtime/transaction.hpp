/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "runtime/runtime_call.hpp"

namespace minichain::runtime {

  namespace transactions {

    struct Transfer {
      AccountId from;
      AccountId to;
      Balance amount;
    };

    struct SetBalance {
      AccountId who;
      Balance amount;
    };

    struct AddValidator {
      AccountId validator;
      staking::Commission commission;
    };

    struct Stake {
      AccountId who;
      Balance amount;
      AccountId validator;
    };

    struct Unstake {
      AccountId who;
    };

    struct ClaimRewards {
      AccountId who;
    };

  }  // namespace transactions

  /**
   * User-facing operation, each maps to exactly one pallet call signed by the
   * account it names
   */
  using Transaction = std::variant<transactions::Transfer,
                                   transactions::SetBalance,
                                   transactions::AddValidator,
                                   transactions::Stake,
                                   transactions::Unstake,
                                   transactions::ClaimRewards>;

  /// @return extrinsic signed by the transaction's account
  Extrinsic toExtrinsic(const Transaction &transaction);

}  // namespace minichain::runtime
