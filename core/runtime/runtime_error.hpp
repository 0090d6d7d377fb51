/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace minichain::runtime {

  enum class RuntimeError {
    /// block header does not carry the next block number
    BLOCK_NUMBER_MISMATCH = 1,
  };

}  // namespace minichain::runtime

OUTCOME_HPP_DECLARE_ERROR(minichain::runtime, RuntimeError);
