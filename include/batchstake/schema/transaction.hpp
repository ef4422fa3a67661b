#pragma once
#include <batchstake/schema/close_batch.hpp>
#include <batchstake/schema/commit_stake.hpp>
#include <batchstake/schema/origin.hpp>
#include <batchstake/schema/primitives.hpp>
#include <batchstake/schema/redeem.hpp>
#include <batchstake/schema/set_stash_destination.hpp>
#include <variant>

namespace batchstake::schema {

using transaction_payload_t = std::variant<commit_stake_t,
                                           close_batch_t,
                                           redeem_t,
                                           set_stash_destination_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  origin_t origin{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace batchstake::schema
