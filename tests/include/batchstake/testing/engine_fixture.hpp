#pragma once

#include <gtest/gtest.h>

#include <batchstake/currency/storage_ledger.hpp>
#include <batchstake/execution/engine.hpp>
#include <batchstake/schema/primitives.hpp>
#include <batchstake/storage/rocksdb/storage.hpp>
#include <batchstake/testing/common.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace batchstake::testing {

using scale_encoder_t = batchstake::schema::encoding::scale_encoder_t;
using storage_t =
    batchstake::storage::storage<batchstake::storage::rocksdb_storage_tag>;

inline batchstake::schema::origin_t signed_by(
    const batchstake::schema::account_id_t& account) {
  return batchstake::schema::signed_origin_t{.account = account};
}

inline batchstake::schema::origin_t root() {
  return batchstake::schema::root_origin_t{};
}

inline batchstake::schema::origin_t none() {
  return batchstake::schema::none_origin_t{};
}

/// Engine over a throwaway RocksDB directory. The engine can be torn down and
/// reopened on the same directory with `restart`.
class engine_fixture final {
 public:
  explicit engine_fixture(
      const std::string_view db_prefix,
      batchstake::execution::engine_config config = {},
      std::unique_ptr<batchstake::currency::ledger> ledger =
          std::make_unique<batchstake::currency::storage_ledger>())
      : db_path_{make_db_path(db_prefix)},
        config_{std::move(config)},
        ledger_{std::move(ledger)} {
    open();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    storage_.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  storage_t& storage() { return *storage_; }
  batchstake::currency::ledger& ledger() { return *ledger_; }
  batchstake::execution::engine& engine() { return *engine_; }

  /// Close the engine and the database, then open both again.
  void restart() {
    engine_.reset();
    storage_.reset();
    open();
  }

  /// Credit `amount` of `currency` to `account` outside any operation.
  void endow(const batchstake::schema::currency_id_t currency,
             const batchstake::schema::account_id_t& account,
             const batchstake::schema::amount_t& amount) {
    auto state = batchstake::currency::state_t{*storage_};
    auto error = ledger_->deposit(state, currency, account, amount);
    ASSERT_FALSE(error.has_value());
    state.commit();
  }

 private:
  void open() {
    storage_.emplace(
        batchstake::storage::make_storage<
            batchstake::storage::rocksdb_storage_tag>(db_path_));
    engine_.emplace(encoder_, *storage_, *ledger_, config_);
  }

  std::string db_path_;
  batchstake::execution::engine_config config_;
  scale_encoder_t encoder_;
  std::unique_ptr<batchstake::currency::ledger> ledger_;
  std::optional<storage_t> storage_;
  std::optional<batchstake::execution::engine> engine_;
};

}  // namespace batchstake::testing
