/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace minichain::primitives {

  /**
   * Index of an extrinsic in a block
   */
  using ExtrinsicIndex = uint32_t;

  /**
   * @brief Extrinsic is a call submitted on behalf of a caller
   */
  template <typename Caller, typename Call>
  struct Extrinsic {
    Caller caller;  ///< who is making the transaction
    Call call;      ///< what action is to be performed
  };
}  // namespace minichain::primitives
