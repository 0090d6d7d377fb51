/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "pallets/balances/calls.hpp"
#include "pallets/staking/calls.hpp"
#include "primitives/block.hpp"
#include "runtime/runtime_config.hpp"

namespace minichain::runtime {

  /// Call of any pallet of the runtime, tagged by the pallet it belongs to
  using RuntimeCall = std::variant<balances::Call<RuntimeConfig>,
                                   staking::Call<RuntimeConfig>>;

  using Extrinsic = primitives::Extrinsic<AccountId, RuntimeCall>;
  using Header = primitives::Header<BlockNumber>;
  using Block = primitives::Block<Header, Extrinsic>;

}  // namespace minichain::runtime
