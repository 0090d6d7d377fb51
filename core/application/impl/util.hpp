/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include "outcome/outcome.hpp"
#include "runtime/runtime_config.hpp"

namespace minichain::application::util {

  enum class Error {
    INVALID_NUMBER = 1,
    NUMBER_OUT_OF_RANGE,
  };

  /// Parses a non-negative decimal balance, up to the full 128-bit range
  outcome::result<runtime::Balance> parseBalance(std::string_view str);

  outcome::result<uint32_t> parseU32(std::string_view str);

}  // namespace minichain::application::util

OUTCOME_HPP_DECLARE_ERROR(minichain::application::util, Error);
