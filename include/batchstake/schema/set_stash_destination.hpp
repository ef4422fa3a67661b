#pragma once

#include <batchstake/schema/primitives.hpp>
#include <cstdint>

// Schema type: set stash destination.
// Accounting workflow: governance points committed staking currency at a new
// custodial account.
namespace batchstake::schema {

template <uint16_t Version>
struct set_stash_destination;

template <>
struct set_stash_destination<1> final {
  uint16_t version{1};
  account_id_t account{};
};

using set_stash_destination_t = set_stash_destination<1>;

}  // namespace batchstake::schema
