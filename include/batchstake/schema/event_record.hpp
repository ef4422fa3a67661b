#pragma once

#include <batchstake/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Accounting workflow: persisted notification with a gap-free id, tagged with
// the ordinal of the operation that emitted it.
namespace batchstake::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t operation{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace batchstake::schema
