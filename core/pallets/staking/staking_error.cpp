/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "pallets/staking/staking_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(minichain::staking, StakingError, e) {
  using E = minichain::staking::StakingError;
  switch (e) {
    case E::InsufficientBalance:
      return "Insufficient balance to stake";
    case E::NotStaked:
      return "Account is not staking";
    case E::AlreadyStaked:
      return "Account is already staking";
    case E::MinimumStakeNotMet:
      return "Minimum stake amount not met";
    case E::InvalidValidator:
      return "Invalid validator";
    case E::TooManyValidators:
      return "Too many validators";
    case E::NotValidator:
      return "Account is not a validator";
    case E::AlreadyValidator:
      return "Account is already a validator";
    case E::RewardCalculationError:
      return "Error calculating rewards";
    case E::UnstakingPeriodNotMet:
      return "Unstaking period not met";
  }
  return "Unknown StakingError";
}
