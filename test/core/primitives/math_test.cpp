/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/math.hpp"

#include <gtest/gtest.h>
#include <boost/multiprecision/cpp_int.hpp>

#include "testutil/outcome.hpp"

using boost::multiprecision::uint128_t;

namespace minichain::math {
  enum class TestArithmeticError {
    VALUE_OVERFLOW = 1,
  };
}

OUTCOME_HPP_DECLARE_ERROR(minichain::math, TestArithmeticError);
OUTCOME_CPP_DEFINE_CATEGORY(minichain::math, TestArithmeticError, e) {
  return "Arithmetic overflow";
}

using minichain::math::TestArithmeticError;
namespace math = minichain::math;

constexpr auto kOverflow = TestArithmeticError::VALUE_OVERFLOW;

static_assert(math::UnsignedInteger<uint8_t>);
static_assert(math::UnsignedInteger<uint64_t>);
static_assert(math::UnsignedInteger<uint128_t>);
static_assert(not math::UnsignedInteger<int32_t>);
static_assert(not math::UnsignedInteger<double>);

/**
 * @given values at the edge of uint8_t
 * @when checked arithmetic is applied
 * @then results which fit are returned, the others yield the supplied error
 */
TEST(MathTest, CheckedU8) {
  EXPECT_OUTCOME_TRUE(sum, math::checked_add<uint8_t>(200, 55, kOverflow));
  EXPECT_EQ(sum, 255);
  EXPECT_EC(math::checked_add<uint8_t>(200, 56, kOverflow),
            kOverflow);

  EXPECT_OUTCOME_TRUE(diff, math::checked_sub<uint8_t>(5, 5, kOverflow));
  EXPECT_EQ(diff, 0);
  EXPECT_EC(math::checked_sub<uint8_t>(5, 6, kOverflow),
            kOverflow);

  EXPECT_OUTCOME_TRUE(product,
                      math::checked_mul<uint8_t>(15, 17, kOverflow));
  EXPECT_EQ(product, 255);
  EXPECT_EC(math::checked_mul<uint8_t>(16, 16, kOverflow),
            kOverflow);
  EXPECT_OUTCOME_TRUE(by_zero,
                      math::checked_mul<uint8_t>(0, 255, kOverflow));
  EXPECT_EQ(by_zero, 0);
}

/**
 * @given 128-bit balances
 * @when checked arithmetic overflows the type
 * @then the error is reported instead of wrapping
 */
TEST(MathTest, CheckedU128) {
  const auto max = std::numeric_limits<uint128_t>::max();

  EXPECT_EC(math::checked_add(max, uint128_t(1), kOverflow), kOverflow);
  EXPECT_EC(math::checked_mul(max, uint128_t(2), kOverflow), kOverflow);
  const uint128_t almost_max = max - 1;
  EXPECT_OUTCOME_TRUE(sum,
                      math::checked_add(almost_max, uint128_t(1), kOverflow));
  EXPECT_EQ(sum, max);
}

/**
 * @given values at the edge of the type
 * @when saturating arithmetic is applied
 * @then results are clamped to the type bounds
 */
TEST(MathTest, Saturating) {
  EXPECT_EQ(math::sat_sub_unsigned<uint32_t>(3, 5), 0u);
  EXPECT_EQ(math::sat_sub_unsigned<uint32_t>(5, 3), 2u);
  EXPECT_EQ(math::sat_add_unsigned<uint32_t>(UINT32_MAX - 1, 5), UINT32_MAX);
  EXPECT_EQ(math::sat_add_unsigned<uint32_t>(1, 2), 3u);
}

/**
 * @given values of a wider unsigned type
 * @when they are converted with checked_cast
 * @then values which fit the target are kept, larger ones yield the error
 */
TEST(MathTest, CheckedCast) {
  EXPECT_OUTCOME_TRUE(fits, math::checked_cast<uint8_t>(255u, kOverflow));
  EXPECT_EQ(fits, 255);
  EXPECT_EC(math::checked_cast<uint8_t>(300u, kOverflow), kOverflow);
  EXPECT_EC(math::checked_cast<uint32_t>(uint128_t(1) << 32, kOverflow),
            kOverflow);

  EXPECT_OUTCOME_TRUE(widened,
                      math::checked_cast<uint128_t>(UINT32_MAX, kOverflow));
  EXPECT_EQ(widened, uint128_t(UINT32_MAX));
}
