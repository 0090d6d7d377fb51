/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <limits>
#include <type_traits>

#include "outcome/outcome.hpp"

namespace minichain::math {

  /**
   * Unsigned integer type usable as a ledger quantity: fundamental unsigned
   * integers as well as fixed-width boost::multiprecision numbers
   */
  template <typename T>
  concept UnsignedInteger = std::numeric_limits<T>::is_specialized
                        and std::numeric_limits<T>::is_integer
                        and not std::numeric_limits<T>::is_signed
                        and std::numeric_limits<T>::is_bounded
                        and std::totally_ordered<T> and std::copyable<T>;

  template <UnsignedInteger T>
  constexpr T zero() {
    return T(0u);
  }

  template <UnsignedInteger T>
  constexpr T one() {
    return T(1u);
  }

  template <UnsignedInteger T>
  constexpr T sat_sub_unsigned(const T &x, const T &y) {
    return x >= y ? T(x - y) : zero<T>();
  }

  template <UnsignedInteger T>
  constexpr T sat_add_unsigned(const T &x, const T &y) {
    if (y > std::numeric_limits<T>::max() - x) {
      return std::numeric_limits<T>::max();
    }
    return T(x + y);
  }

  /**
   * @return x + y, or error \arg e if the sum does not fit into T
   */
  template <UnsignedInteger T, typename E>
  inline outcome::result<T> checked_add(const T &x, const T &y, E e) {
    if (y > std::numeric_limits<T>::max() - x) {
      return e;
    }
    return T(x + y);
  }

  /**
   * @return x - y, or error \arg e if y is greater than x
   */
  template <UnsignedInteger T, typename E>
  inline outcome::result<T> checked_sub(const T &x, const T &y, E e) {
    if (x >= y) {
      return T(x - y);
    }
    return e;
  }

  /**
   * @return x * y, or error \arg e if the product does not fit into T
   */
  template <UnsignedInteger T, typename E>
  inline outcome::result<T> checked_mul(const T &x, const T &y, E e) {
    if (x != zero<T>() and y > std::numeric_limits<T>::max() / x) {
      return e;
    }
    return T(x * y);
  }

  /**
   * @return \arg from converted to To, or error \arg e if it does not fit
   */
  template <UnsignedInteger To, UnsignedInteger From, typename E>
  inline outcome::result<To> checked_cast(const From &from, E e) {
    if constexpr (std::numeric_limits<From>::digits
                  > std::numeric_limits<To>::digits) {
      if (from > From(std::numeric_limits<To>::max())) {
        return e;
      }
    }
    return To(from);
  }

}  // namespace minichain::math
