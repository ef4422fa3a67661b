#pragma once

#include <batchstake/schema/primitives.hpp>
#include <cstdint>

// Schema type: close batch.
// Accounting workflow: issuer attests the staking total and fixes the open
// batch's exchange rate.
namespace batchstake::schema {

template <uint16_t Version>
struct close_batch;

template <>
struct close_batch<1> final {
  uint16_t version{1};
  amount_t staking_total{};
};

using close_batch_t = close_batch<1>;

}  // namespace batchstake::schema
