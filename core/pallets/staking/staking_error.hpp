/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "outcome/outcome.hpp"

namespace minichain::staking {

  enum class StakingError : uint8_t {
    InsufficientBalance = 1,
    NotStaked,
    AlreadyStaked,
    MinimumStakeNotMet,
    /// Validator is unknown, inactive, or has an out-of-range commission
    InvalidValidator,
    TooManyValidators,
    NotValidator,
    AlreadyValidator,
    /// Arithmetic overflow in reward or stake bookkeeping
    RewardCalculationError,
    UnstakingPeriodNotMet,
  };

}  // namespace minichain::staking

OUTCOME_HPP_DECLARE_ERROR(minichain::staking, StakingError);
