/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>
#include <vector>

#include "primitives/common.hpp"
#include "primitives/extrinsic.hpp"
#include "runtime/runtime_config.hpp"

namespace minichain::runtime {

  struct FailedExtrinsic {
    primitives::ExtrinsicIndex index;
    std::error_code error;
  };

  /**
   * Outcome of an executed block. Every extrinsic index appears in exactly
   * one of \a successful and \a failed.
   */
  struct BlockResult {
    BlockNumber block_number;
    primitives::BlockHash block_hash;
    std::vector<primitives::ExtrinsicIndex> successful;
    std::vector<FailedExtrinsic> failed;
  };

}  // namespace minichain::runtime
