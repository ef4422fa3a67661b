#include <gtest/gtest.h>
#include <batchstake/arithmetic/ratio.hpp>

#include <limits>

namespace {

using batchstake::arithmetic::ratio;
using batchstake::schema::amount_t;

const amount_t kMax = std::numeric_limits<amount_t>::max();

}  // namespace

TEST(ratio, from_rational_scales_to_eighteen_decimals) {
  auto half = ratio::checked_from_rational(500, 1000);
  ASSERT_TRUE(half.has_value());
  EXPECT_EQ(half->inner(), amount_t{500'000'000'000'000'000ULL});

  auto two = ratio::checked_from_rational(2000, 1000);
  ASSERT_TRUE(two.has_value());
  EXPECT_EQ(*two, ratio::from_inner(amount_t{2'000'000'000'000'000'000ULL}));
}

TEST(ratio, from_rational_truncates) {
  auto third = ratio::checked_from_rational(1, 3);
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->inner(), amount_t{333'333'333'333'333'333ULL});
  EXPECT_EQ(third->checked_mul_int(3), amount_t{0});
  EXPECT_EQ(third->checked_mul_int(10), amount_t{3});
}

TEST(ratio, zero_denominator_is_not_representable) {
  EXPECT_FALSE(ratio::checked_from_rational(1, 0).has_value());
  EXPECT_FALSE(ratio::checked_from_rational(0, 0).has_value());
}

TEST(ratio, oversized_quotient_is_not_representable) {
  // kMax / 1 scaled by 10^18 leaves the 128-bit range.
  EXPECT_FALSE(ratio::checked_from_rational(kMax, 1).has_value());
  EXPECT_TRUE(ratio::checked_from_rational(kMax, kMax).has_value());
}

TEST(ratio, multiplication_reports_overflow) {
  auto two = ratio::checked_from_rational(2, 1);
  ASSERT_TRUE(two.has_value());
  EXPECT_FALSE(two->checked_mul_int(kMax).has_value());
  EXPECT_EQ(two->checked_mul_int(kMax / 2), amount_t{kMax - 1});
}

TEST(ratio, zero_ratio_and_zero_value_mint_nothing) {
  auto zero = ratio::checked_from_rational(0, 1000);
  ASSERT_TRUE(zero.has_value());
  EXPECT_EQ(zero->checked_mul_int(1'000'000), amount_t{0});

  auto one = ratio::checked_from_rational(7, 7);
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(one->checked_mul_int(0), amount_t{0});
  EXPECT_EQ(one->checked_mul_int(kMax), kMax);
}
