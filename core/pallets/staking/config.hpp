/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "pallets/balances/config.hpp"

namespace minichain::staking {

  /// Rewards scale with elapsed blocks, so a block count must be expressible
  /// as a balance
  template <typename T>
  concept Config = balances::Config<T>
               and std::constructible_from<typename T::Balance,
                                           typename T::BlockNumber>;

}  // namespace minichain::staking
