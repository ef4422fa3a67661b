#pragma once

#include <batchstake/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Accounting workflow: notification emitted by a successful operation
// (mint_requested, batch_processed, liquid_currency_claimed, stash_updated).
namespace batchstake::schema {

inline constexpr std::string_view kMintRequestedEvent{"mint_requested"};
inline constexpr std::string_view kBatchProcessedEvent{"batch_processed"};
inline constexpr std::string_view kLiquidCurrencyClaimedEvent{
    "liquid_currency_claimed"};
inline constexpr std::string_view kStashUpdatedEvent{"stash_updated"};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

/// Value of the first attribute named `key`, or empty when absent.
inline std::string attribute_value(const transaction_event_t& event,
                                   const std::string_view key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return {};
}

}  // namespace batchstake::schema
