/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "pallets/balances/config.hpp"

namespace minichain::balances {

  /// Moves \a amount from the caller to \a to, the caller pays the fee
  template <Config T>
  struct Transfer {
    typename T::AccountId to;
    typename T::Balance amount;
  };

  /// Overwrites the balance of \a who (issuance)
  template <Config T>
  struct SetBalance {
    typename T::AccountId who;
    typename T::Balance amount;
  };

  template <Config T>
  using Call = std::variant<Transfer<T>, SetBalance<T>>;

}  // namespace minichain::balances
