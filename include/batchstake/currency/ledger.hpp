#pragma once

#include <batchstake/schema/error_code.hpp>
#include <batchstake/schema/primitives.hpp>
#include <batchstake/storage/overlay.hpp>
#include <batchstake/storage/rocksdb/storage.hpp>
#include <optional>

namespace batchstake::currency {

using state_t =
    batchstake::storage::overlay<batchstake::storage::rocksdb_storage_tag>;

/// std::nullopt on success, otherwise the reason the ledger refused.
using ledger_result_t = std::optional<batchstake::schema::error_code>;

/// Multi-currency balance ledger the accounting engine settles against.
///
/// Every call receives the unit of work of the operation in progress, so
/// ledger writes commit or roll back together with the engine's own writes.
/// Implementations must leave `state` untouched when they return an error.
class ledger {
 public:
  virtual ~ledger() = default;

  /// Move `amount` of `currency` between accounts.
  virtual ledger_result_t transfer(state_t& state,
                                   batchstake::schema::currency_id_t currency,
                                   const batchstake::schema::account_id_t& from,
                                   const batchstake::schema::account_id_t& to,
                                   const batchstake::schema::amount_t& amount) = 0;

  /// Mint `amount` of `currency` into `to`, raising total issuance.
  virtual ledger_result_t deposit(state_t& state,
                                  batchstake::schema::currency_id_t currency,
                                  const batchstake::schema::account_id_t& to,
                                  const batchstake::schema::amount_t& amount) = 0;

  virtual batchstake::schema::amount_t total_issuance(
      const state_t& state,
      batchstake::schema::currency_id_t currency) const = 0;

  virtual batchstake::schema::amount_t free_balance(
      const state_t& state,
      batchstake::schema::currency_id_t currency,
      const batchstake::schema::account_id_t& account) const = 0;
};

}  // namespace batchstake::currency
