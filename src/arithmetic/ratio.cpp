#include <batchstake/arithmetic/ratio.hpp>

#include <limits>

namespace batchstake::arithmetic {

namespace {

using batchstake::schema::amount_t;
using batchstake::schema::wide_amount_t;

const wide_amount_t& max_amount() {
  static const auto value = wide_amount_t{std::numeric_limits<amount_t>::max()};
  return value;
}

}  // namespace

ratio ratio::from_inner(const amount_t& inner) {
  return ratio{inner};
}

std::optional<ratio> ratio::checked_from_rational(const amount_t& numerator,
                                                  const amount_t& denominator) {
  if (denominator == 0) {
    return std::nullopt;
  }
  auto scaled =
      (wide_amount_t{numerator} * kAccuracy) / wide_amount_t{denominator};
  if (scaled > max_amount()) {
    return std::nullopt;
  }
  return ratio{static_cast<amount_t>(scaled)};
}

std::optional<amount_t> ratio::checked_mul_int(const amount_t& value) const {
  auto product = (wide_amount_t{inner_} * wide_amount_t{value}) / kAccuracy;
  if (product > max_amount()) {
    return std::nullopt;
  }
  return static_cast<amount_t>(product);
}

}  // namespace batchstake::arithmetic
