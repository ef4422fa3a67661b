#pragma once

#include <batchstake/schema/primitives.hpp>
#include <cstdint>

// Schema type: commit stake.
// Accounting workflow: lock staking currency into the open batch.
namespace batchstake::schema {

template <uint16_t Version>
struct commit_stake;

template <>
struct commit_stake<1> final {
  uint16_t version{1};
  amount_t amount{};
};

using commit_stake_t = commit_stake<1>;

}  // namespace batchstake::schema
