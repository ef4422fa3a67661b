#pragma once

#include <batchstake/currency/ledger.hpp>
#include <batchstake/execution/capability_check.hpp>
#include <batchstake/execution/config.hpp>
#include <batchstake/schema/app_info.hpp>
#include <batchstake/schema/batch_snapshot.hpp>
#include <batchstake/schema/encoding/scale/encoder.hpp>
#include <batchstake/schema/error_code.hpp>
#include <batchstake/schema/event_record.hpp>
#include <batchstake/schema/origin.hpp>
#include <batchstake/schema/primitives.hpp>
#include <batchstake/schema/query_result.hpp>
#include <batchstake/schema/transaction.hpp>
#include <batchstake/schema/transaction_result.hpp>
#include <batchstake/storage/overlay.hpp>
#include <batchstake/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace batchstake::execution {

/// Receives every persisted notification after its operation committed.
/// Called on the operating thread once the engine lock is released, so a
/// sink may query the engine. Concurrent operations may interleave; order
/// by `event_id`.
using event_sink_t =
    std::function<void(const batchstake::schema::event_record_t& record)>;

/// Batched liquid-staking accounting state machine.
///
/// Users commit staking currency into the open batch, an issuer closes the
/// batch by snapshotting total issuance, and pending commitments are later
/// redeemed for liquid currency at the snapshot's exchange rate. All state is
/// kept in the storage backend so it survives restarts.
///
/// Every mutating call runs under one engine-wide lock against a fresh
/// storage overlay. The overlay (including ledger writes, emitted events and
/// the updated checkpoint) is written as one atomic batch on success and
/// dropped on failure, so a failed call leaves no trace.
class engine final {
 public:
  using encoder_t = batchstake::schema::encoding::scale_encoder_t;
  using storage_t =
      batchstake::storage::storage<batchstake::storage::rocksdb_storage_tag>;
  using state_t = batchstake::currency::state_t;

  /// Construct the engine over an opened storage backend.
  ///
  /// On a fresh database the batch cursor is seeded with
  /// `config.genesis_batch`. The capability check defaults to
  /// `make_default_capability_check(config)`.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  batchstake::currency::ledger& ledger,
                  engine_config config = {});

  /// Lock `amount` of the staking currency into the open batch for the
  /// signed caller. Fails with `stash_not_configured` before anything else
  /// when no stash destination is set.
  batchstake::schema::transaction_result_t commit(
      const batchstake::schema::origin_t& origin,
      const batchstake::schema::amount_t& amount);

  /// Close the open batch with an issuer-attested staking total and open
  /// the next one.
  batchstake::schema::transaction_result_t close(
      const batchstake::schema::origin_t& origin,
      const batchstake::schema::amount_t& staking_total);

  /// Mint the liquid currency owed to `who` for a closed batch and clear
  /// the pending entry.
  batchstake::schema::transaction_result_t redeem(
      const batchstake::schema::origin_t& origin,
      const batchstake::schema::account_id_t& who,
      batchstake::schema::batch_id_t batch);

  /// Replace the stash destination (governance only).
  batchstake::schema::transaction_result_t set_stash_destination(
      const batchstake::schema::origin_t& origin,
      const batchstake::schema::account_id_t& account);

  /// Decode a SCALE transaction envelope and run it.
  batchstake::schema::transaction_result_t execute(
      const batchstake::schema::bytes_view_t& raw_tx);

  /// Decode and version-check an envelope without running it.
  batchstake::schema::transaction_result_t check_transaction(
      const batchstake::schema::bytes_view_t& raw_tx) const;

  batchstake::schema::amount_t pending_amount(
      batchstake::schema::batch_id_t batch,
      const batchstake::schema::account_id_t& user) const;
  std::optional<batchstake::schema::batch_snapshot_t> batch_snapshot(
      batchstake::schema::batch_id_t batch) const;
  batchstake::schema::batch_id_t current_batch() const;
  std::optional<batchstake::schema::account_id_t> stash_destination() const;
  /// Every outstanding pending entry of `batch`, ordered by account.
  std::vector<std::pair<batchstake::schema::account_id_t,
                        batchstake::schema::amount_t>>
  pending_entries(batchstake::schema::batch_id_t batch) const;
  /// Sum of every amount committed to `batch`.
  batchstake::schema::amount_t batch_committed_total(
      batchstake::schema::batch_id_t batch) const;
  batchstake::schema::amount_t balance(
      batchstake::schema::currency_id_t currency,
      const batchstake::schema::account_id_t& account) const;
  batchstake::schema::amount_t total_issuance(
      batchstake::schema::currency_id_t currency) const;

  /// Persisted events with ids in [from_id, to_id], oldest first.
  std::vector<batchstake::schema::event_record_t> events(uint64_t from_id,
                                                         uint64_t to_id) const;

  /// Applied operation count, rolling state root and open batch.
  batchstake::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  batchstake::schema::query_result_t query(
      std::string_view path,
      const batchstake::schema::bytes_view_t& data) const;

  /// Replace the authorization backend.
  void set_capability_check(capability_check_t check);

  /// Install a live listener for committed events.
  void set_event_sink(event_sink_t sink);

  const engine_config& config() const { return config_; }

 private:
  /// Run one operation inside its own unit of work.
  batchstake::schema::transaction_result_t run(
      const batchstake::schema::transaction_t& tx,
      const batchstake::schema::bytes_view_t& encoded);

  batchstake::schema::transaction_result_t execute_commit(
      state_t& state,
      const batchstake::schema::origin_t& origin,
      const batchstake::schema::commit_stake_t& payload);
  batchstake::schema::transaction_result_t execute_close(
      state_t& state,
      const batchstake::schema::origin_t& origin,
      const batchstake::schema::close_batch_t& payload);
  batchstake::schema::transaction_result_t execute_redeem(
      state_t& state,
      const batchstake::schema::origin_t& origin,
      const batchstake::schema::redeem_t& payload);
  batchstake::schema::transaction_result_t execute_set_stash_destination(
      state_t& state,
      const batchstake::schema::origin_t& origin,
      const batchstake::schema::set_stash_destination_t& payload);

  bool authorized(batchstake::schema::capability_t capability,
                  const batchstake::schema::origin_t& origin) const;

  batchstake::schema::batch_id_t read_current_batch(const state_t& state) const;
  std::optional<batchstake::schema::account_id_t> read_stash_destination(
      const state_t& state) const;
  std::optional<batchstake::schema::batch_snapshot_t> read_batch_snapshot(
      const state_t& state,
      batchstake::schema::batch_id_t batch) const;
  batchstake::schema::amount_t read_pending_amount(
      const state_t& state,
      batchstake::schema::batch_id_t batch,
      const batchstake::schema::account_id_t& user) const;
  batchstake::schema::amount_t read_batch_committed_total(
      const state_t& state,
      batchstake::schema::batch_id_t batch) const;
  std::vector<std::pair<batchstake::schema::account_id_t,
                        batchstake::schema::amount_t>>
  read_pending_entries(batchstake::schema::batch_id_t batch) const;
  std::vector<batchstake::schema::event_record_t> read_events(
      const state_t& state,
      uint64_t from_id,
      uint64_t to_id) const;

  /// Append events to the log inside `state`; returns the stored records.
  std::vector<batchstake::schema::event_record_t> record_events(
      state_t& state,
      uint64_t operation,
      const std::vector<batchstake::schema::transaction_event_t>& events);

  /// Seed the cursor and load the persisted checkpoint.
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  batchstake::currency::ledger& ledger_;
  engine_config config_;
  capability_check_t capability_check_;
  event_sink_t event_sink_;
  uint64_t applied_operations_{};
  batchstake::schema::hash32_t state_root_{};
};

}  // namespace batchstake::execution
