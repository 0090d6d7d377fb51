/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace minichain::primitives {
  /**
   * @struct Header represents header of a block
   */
  template <typename BlockNumber>
  struct Header {
    BlockNumber block_number{};  ///< Block number (height)

    bool operator==(const Header &) const = default;
  };
}  // namespace minichain::primitives
