/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace minichain::common {

  /**
   * @brief Converts bytes to hex representation
   * @param bytes to be converted
   * @return hexstring
   */
  std::string hex_lower(std::span<const uint8_t> bytes);

}  // namespace minichain::common
