/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>

#include <fmt/format.h>

#include "primitives/math.hpp"

namespace minichain::system {

  /// Identity of an account: ordered (ledger maps are sorted), cloneable and
  /// printable to logs
  template <typename T>
  concept AccountIdType = std::totally_ordered<T> and std::copyable<T>
                      and fmt::is_formattable<T>::value;

  /**
   * Types every pallet of a runtime shares. A runtime defines them once, so
   * all pallets instantiated with it agree on them.
   */
  template <typename T>
  concept Config = requires {
    typename T::AccountId;
    typename T::BlockNumber;
    typename T::Nonce;
  } and AccountIdType<typename T::AccountId>
                   and math::UnsignedInteger<typename T::BlockNumber>
                   and math::UnsignedInteger<typename T::Nonce>;

}  // namespace minichain::system
