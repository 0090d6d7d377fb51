/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

#include "pallets/staking/config.hpp"

namespace minichain::runtime {

  /**
   * Concrete types every pallet of the runtime is instantiated with
   */
  struct RuntimeConfig {
    using AccountId = std::string;
    using BlockNumber = uint32_t;
    using Nonce = uint32_t;
    using Balance = boost::multiprecision::uint128_t;
  };

  static_assert(system::Config<RuntimeConfig>);
  static_assert(balances::Config<RuntimeConfig>);
  static_assert(staking::Config<RuntimeConfig>);

  using AccountId = RuntimeConfig::AccountId;
  using BlockNumber = RuntimeConfig::BlockNumber;
  using Nonce = RuntimeConfig::Nonce;
  using Balance = RuntimeConfig::Balance;

}  // namespace minichain::runtime
