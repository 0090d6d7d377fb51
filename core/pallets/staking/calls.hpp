/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "pallets/staking/types.hpp"

namespace minichain::staking {

  /// Registers the caller as a validator
  template <Config T>
  struct AddValidator {
    Commission commission;
  };

  template <Config T>
  struct RemoveValidator {
    typename T::AccountId validator;
  };

  /// Locks \a amount of the caller's funds behind \a validator
  template <Config T>
  struct Stake {
    typename T::Balance amount;
    typename T::AccountId validator;
  };

  template <Config T>
  struct Unstake {};

  template <Config T>
  struct ClaimRewards {};

  template <Config T>
  using Call = std::variant<AddValidator<T>,
                            RemoveValidator<T>,
                            Stake<T>,
                            Unstake<T>,
                            ClaimRewards<T>>;

}  // namespace minichain::staking
