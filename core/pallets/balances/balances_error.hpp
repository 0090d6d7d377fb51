/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "outcome/outcome.hpp"

namespace minichain::balances {

  enum class BalancesError : uint8_t {
    /// Sender can not cover amount and fee
    InsufficientBalance = 1,
    /// Payer can not cover the fee
    InsufficientFunds,
    OverflowInCalculation,
    OverflowInTransfer,
    InvalidAmount,
  };

}  // namespace minichain::balances

OUTCOME_HPP_DECLARE_ERROR(minichain::balances, BalancesError);
