#pragma once

#include <batchstake/schema/primitives.hpp>
#include <cstdint>

// Schema type: batch snapshot.
// Accounting workflow: exchange-rate basis fixed when a batch closes. Written
// once per batch and kept forever so late redemptions still price correctly.
namespace batchstake::schema {

template <uint16_t Version>
struct batch_snapshot;

template <>
struct batch_snapshot<1> final {
  uint16_t version{1};
  amount_t staking_total{};
  amount_t liquid_total{};
};

using batch_snapshot_t = batch_snapshot<1>;

}  // namespace batchstake::schema
