/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "pallets/staking/types.hpp"
#include "runtime/genesis_config.hpp"
#include "runtime/transaction.hpp"

namespace minichain::application {

  /// Transactions of one block, in execution order
  using BlockTransactions = std::vector<runtime::Transaction>;

  /**
   * Stores the chain specification: genesis state, runtime parameters and
   * the blocks to execute on top of genesis
   */
  class ChainSpec {
   public:
    virtual ~ChainSpec() = default;

    virtual const std::string &name() const = 0;

    virtual const std::string &id() const = 0;

    virtual const runtime::GenesisConfig &genesis() const = 0;

    virtual const staking::Parameters<runtime::RuntimeConfig> &
    stakingParameters() const = 0;

    virtual const std::vector<BlockTransactions> &blocks() const = 0;
  };

}  // namespace minichain::application
