/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/util.hpp"

#include <charconv>

#include "primitives/math.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(minichain::application::util, Error, e) {
  using E = minichain::application::util::Error;
  switch (e) {
    case E::INVALID_NUMBER:
      return "Value is not a non-negative decimal number";
    case E::NUMBER_OUT_OF_RANGE:
      return "Number is out of range";
  }
  return "Unknown application::util error";
}

namespace minichain::application::util {

  using runtime::Balance;

  outcome::result<Balance> parseBalance(std::string_view str) {
    if (str.empty()) {
      return Error::INVALID_NUMBER;
    }
    auto value = math::zero<Balance>();
    for (auto c : str) {
      if (c < '0' or c > '9') {
        return Error::INVALID_NUMBER;
      }
      OUTCOME_TRY(shifted,
                  math::checked_mul(
                      value, Balance(10u), Error::NUMBER_OUT_OF_RANGE));
      OUTCOME_TRY(next,
                  math::checked_add(shifted,
                                    Balance(static_cast<unsigned>(c - '0')),
                                    Error::NUMBER_OUT_OF_RANGE));
      value = std::move(next);
    }
    return value;
  }

  outcome::result<uint32_t> parseU32(std::string_view str) {
    uint32_t value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec == std::errc::result_out_of_range) {
      return Error::NUMBER_OUT_OF_RANGE;
    }
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
      return Error::INVALID_NUMBER;
    }
    return value;
  }

}  // namespace minichain::application::util
