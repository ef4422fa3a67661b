#pragma once

#include <batchstake/schema/primitives.hpp>
#include <optional>

namespace batchstake::arithmetic {

/// Unsigned fixed-point rational with 18 decimal places held in 128 bits.
///
/// Construction and integer multiplication both truncate toward zero and
/// report std::nullopt instead of wrapping when a result leaves the 128-bit
/// range. Intermediate products are carried in 256 bits.
class ratio final {
 public:
  static constexpr uint64_t kAccuracy = 1'000'000'000'000'000'000ULL;

  ratio() = default;

  /// Wrap an already scaled inner value (inner / 10^18).
  static ratio from_inner(const batchstake::schema::amount_t& inner);

  /// numerator / denominator, std::nullopt on a zero denominator or when the
  /// scaled quotient does not fit.
  static std::optional<ratio> checked_from_rational(
      const batchstake::schema::amount_t& numerator,
      const batchstake::schema::amount_t& denominator);

  /// floor(value * this), std::nullopt when the product does not fit.
  std::optional<batchstake::schema::amount_t> checked_mul_int(
      const batchstake::schema::amount_t& value) const;

  const batchstake::schema::amount_t& inner() const { return inner_; }

  bool operator==(const ratio& other) const = default;

 private:
  explicit ratio(const batchstake::schema::amount_t& inner) : inner_{inner} {}

  batchstake::schema::amount_t inner_{};
};

}  // namespace batchstake::arithmetic
