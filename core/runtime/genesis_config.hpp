/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "runtime/runtime_config.hpp"
#include "pallets/staking/types.hpp"

namespace minichain::runtime {

  struct GenesisValidator {
    AccountId id;
    staking::Commission commission;
  };

  /**
   * Initial state of the chain, applied before block 1
   */
  struct GenesisConfig {
    std::vector<std::pair<AccountId, Balance>> balances;
    Balance base_fee{0u};
    std::optional<AccountId> fee_recipient;
    std::vector<GenesisValidator> validators;
  };

}  // namespace minichain::runtime
