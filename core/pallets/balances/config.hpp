/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "pallets/system/config.hpp"

namespace minichain::balances {

  /**
   * Balance must support checked arithmetic, so the ledger can reject
   * overflowing or underflowing updates instead of wrapping
   */
  template <typename T>
  concept Config = system::Config<T> and requires {
    typename T::Balance;
  } and math::UnsignedInteger<typename T::Balance>;

}  // namespace minichain::balances
