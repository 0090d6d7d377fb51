/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "primitives/block_header.hpp"
#include "primitives/extrinsic.hpp"

namespace minichain::primitives {
  /**
   * @brief Block is a header plus an ordered collection of extrinsics
   */
  template <typename HeaderT, typename ExtrinsicT>
  struct Block {
    HeaderT header;                      ///< block header
    std::vector<ExtrinsicT> extrinsics;  ///< extrinsics collection
  };
}  // namespace minichain::primitives
