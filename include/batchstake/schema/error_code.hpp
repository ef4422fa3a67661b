#pragma once

#include <batchstake/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Accounting workflow: stable numeric failure taxonomy returned by every
// operation. Codes below 20 are raised by the engine itself; codes from 20 are
// currency ledger failures passed through unchanged.
namespace batchstake::schema {

enum class error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  unauthorized = 10,
  stash_not_configured = 11,
  invalid_staked_currency_total_issuance = 12,
  liquid_currency_not_issued_for_this_batch = 13,
  arithmetic_overflow = 14,
  insufficient_balance = 20,
  balance_overflow = 21,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"invalid_transaction",
                                            error_code::invalid_transaction},
    std::pair<std::string_view, error_code>{
        "unsupported_transaction_version",
        error_code::unsupported_transaction_version},
    std::pair<std::string_view, error_code>{"unauthorized",
                                            error_code::unauthorized},
    std::pair<std::string_view, error_code>{"stash_not_configured",
                                            error_code::stash_not_configured},
    std::pair<std::string_view, error_code>{
        "invalid_staked_currency_total_issuance",
        error_code::invalid_staked_currency_total_issuance},
    std::pair<std::string_view, error_code>{
        "liquid_currency_not_issued_for_this_batch",
        error_code::liquid_currency_not_issued_for_this_batch},
    std::pair<std::string_view, error_code>{"arithmetic_overflow",
                                            error_code::arithmetic_overflow},
    std::pair<std::string_view, error_code>{"insufficient_balance",
                                            error_code::insufficient_balance},
    std::pair<std::string_view, error_code>{"balance_overflow",
                                            error_code::balance_overflow}};

template <>
inline std::optional<error_code> try_from_string<error_code>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

/// True for failures raised by the currency ledger rather than the engine.
inline constexpr bool is_currency_error(const error_code value) {
  return static_cast<uint32_t>(value) >= 20;
}

}  // namespace batchstake::schema
