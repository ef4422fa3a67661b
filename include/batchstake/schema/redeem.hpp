#pragma once

#include <batchstake/schema/primitives.hpp>
#include <cstdint>

// Schema type: redeem.
// Accounting workflow: convert a closed batch's pending commitment of `who`
// into liquid currency. Any signed origin may submit it on their behalf.
namespace batchstake::schema {

template <uint16_t Version>
struct redeem;

template <>
struct redeem<1> final {
  uint16_t version{1};
  account_id_t who{};
  batch_id_t batch{};
};

using redeem_t = redeem<1>;

}  // namespace batchstake::schema
