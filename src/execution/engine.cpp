#include <spdlog/spdlog.h>
#include <algorithm>
#include <batchstake/arithmetic/ratio.hpp>
#include <batchstake/blake3/hash.hpp>
#include <batchstake/common/critical.hpp>
#include <batchstake/execution/engine.hpp>
#include <batchstake/schema/key/engine_keys.hpp>
#include <batchstake/schema/query_error_code.hpp>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <tuple>
#include <utility>

using namespace batchstake::schema;

namespace {

constexpr auto kMaxEventRange = uint64_t{1024};

transaction_result_t make_error(const error_code code,
                                const std::string_view codespace,
                                std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace =
      is_currency_error(code) ? "batchstake.currency" : std::string{codespace};
  return result;
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = false) {
  return transaction_event_attribute_t{
      .version = 1, .key = std::move(key), .value = std::move(value), .index = index};
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoding::scale_encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.codespace = "batchstake.query";
  return result;
}

}  // namespace

namespace batchstake::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               batchstake::currency::ledger& ledger,
               engine_config config)
    : encoder_{encoder},
      storage_{storage},
      ledger_{ledger},
      config_{std::move(config)},
      capability_check_{make_default_capability_check(config_)} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info(
      "Initializing accounting engine (staking currency {}, liquid currency "
      "{}, {} issuer(s), {} governor(s))",
      config_.staking_currency, config_.liquid_currency, config_.issuers.size(),
      config_.governors.size());
  if (config_.staking_currency == config_.liquid_currency) {
    spdlog::warn("Staking and liquid currency share id {}",
                 config_.staking_currency);
  }
  load_persisted_state();
  spdlog::info("Accounting engine ready after {} operation(s); batch {} open",
               applied_operations_,
               read_current_batch(state_t{storage_}));
}

transaction_result_t engine::commit(const origin_t& origin,
                                    const amount_t& amount) {
  auto tx = transaction_t{.version = 1,
                          .origin = origin,
                          .payload = commit_stake_t{.amount = amount}};
  auto encoded = encoder_.encode(tx);
  return run(tx, make_bytes_view(encoded));
}

transaction_result_t engine::close(const origin_t& origin,
                                   const amount_t& staking_total) {
  auto tx = transaction_t{
      .version = 1,
      .origin = origin,
      .payload = close_batch_t{.staking_total = staking_total}};
  auto encoded = encoder_.encode(tx);
  return run(tx, make_bytes_view(encoded));
}

transaction_result_t engine::redeem(const origin_t& origin,
                                    const account_id_t& who,
                                    const batch_id_t batch) {
  auto tx = transaction_t{.version = 1,
                          .origin = origin,
                          .payload = redeem_t{.who = who, .batch = batch}};
  auto encoded = encoder_.encode(tx);
  return run(tx, make_bytes_view(encoded));
}

transaction_result_t engine::set_stash_destination(
    const origin_t& origin,
    const account_id_t& account) {
  auto tx = transaction_t{
      .version = 1,
      .origin = origin,
      .payload = set_stash_destination_t{.account = account}};
  auto encoded = encoder_.encode(tx);
  return run(tx, make_bytes_view(encoded));
}

transaction_result_t engine::check_transaction(
    const bytes_view_t& raw_tx) const {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error(error_code::invalid_transaction, "batchstake.checktx",
                      decode_error);
  }
  if (maybe_tx->version != 1) {
    return make_error(error_code::unsupported_transaction_version,
                      "batchstake.checktx", "expected version 1");
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  auto checked = check_transaction(raw_tx);
  if (checked.code != 0) {
    checked.codespace = "batchstake.execute";
    spdlog::warn("Rejected transaction envelope: {} ({})", checked.log,
                 checked.info);
    return checked;
  }
  auto decode_error = std::string{};
  auto tx = decode_transaction(raw_tx, decode_error);
  return run(*tx, raw_tx);
}

transaction_result_t engine::run(const transaction_t& tx,
                                 const bytes_view_t& encoded) {
  auto lock = std::unique_lock{mutex_};
  auto state = state_t{storage_};

  auto result = std::visit(
      overloaded{[&](const commit_stake_t& payload) {
                   return execute_commit(state, tx.origin, payload);
                 },
                 [&](const close_batch_t& payload) {
                   return execute_close(state, tx.origin, payload);
                 },
                 [&](const redeem_t& payload) {
                   return execute_redeem(state, tx.origin, payload);
                 },
                 [&](const set_stash_destination_t& payload) {
                   return execute_set_stash_destination(state, tx.origin,
                                                        payload);
                 }},
      tx.payload);

  if (result.code != 0) {
    state.discard();
    spdlog::debug("Operation rejected: {} [{}] {}", result.log,
                  result.codespace, result.info);
    return result;
  }

  auto operation = applied_operations_ + 1;
  auto state_root = batchstake::blake3::fold(state_root_, encoded);
  auto records = record_events(state, operation, result.events);
  auto [committed_key, committed_value] =
      storage_t::make_committed_state_entry(batchstake::storage::committed_state{
          .applied_operations = operation, .state_root = state_root});
  state.put_raw(make_bytes_view(committed_key), std::move(committed_value));
  state.commit();

  applied_operations_ = operation;
  state_root_ = state_root;
  auto sink = event_sink_;
  lock.unlock();

  if (sink) {
    for (const auto& record : records) {
      sink(record);
    }
  }
  return result;
}

transaction_result_t engine::execute_commit(state_t& state,
                                            const origin_t& origin,
                                            const commit_stake_t& payload) {
  static constexpr auto kCodespace = std::string_view{"batchstake.commit"};

  auto stash = read_stash_destination(state);
  if (!stash) {
    return make_error(error_code::stash_not_configured, kCodespace,
                      "stash destination has not been set by governance");
  }
  auto who = signed_account(origin);
  if (!who || !authorized(capability_t::signed_account, origin)) {
    return make_error(error_code::unauthorized, kCodespace,
                      "commit requires a signed origin");
  }

  auto batch = read_current_batch(state);
  auto transferred = ledger_.transfer(state, config_.staking_currency, *who,
                                      *stash, payload.amount);
  if (transferred) {
    return make_error(*transferred, kCodespace,
                      "staking currency transfer to stash failed");
  }
  // Forwarding the stash balance to the relay custodian happens out of band.
  spdlog::debug("Relay transfer of {} from stash {} left to the custodian",
                to_string(payload.amount), to_hex(*stash));

  auto pending_key = key::make_pending_key(encoder_, batch, *who);
  auto pending = read_pending_amount(state, batch, *who);
  if (pending > std::numeric_limits<amount_t>::max() - payload.amount) {
    batchstake::common::critical("Pending amount should not overflow");
  }
  state.put(encoder_, make_bytes_view(pending_key),
            amount_t{pending + payload.amount});

  auto committed_key = key::make_batch_committed_key(encoder_, batch);
  auto committed = read_batch_committed_total(state, batch);
  if (committed > std::numeric_limits<amount_t>::max() - payload.amount) {
    batchstake::common::critical("Batch committed total should not overflow");
  }
  state.put(encoder_, make_bytes_view(committed_key),
            amount_t{committed + payload.amount});

  spdlog::debug("Mint requested: batch {} account {} amount {}", batch,
                to_hex(*who), to_string(payload.amount));

  auto result = transaction_result_t{};
  result.info = "mint requested";
  result.events.push_back(transaction_event_t{
      .version = 1,
      .type = std::string{kMintRequestedEvent},
      .attributes = {make_attribute("batch", std::to_string(batch), true),
                     make_attribute("account", to_hex(*who), true),
                     make_attribute("amount", to_string(payload.amount))}});
  return result;
}

transaction_result_t engine::execute_close(state_t& state,
                                           const origin_t& origin,
                                           const close_batch_t& payload) {
  static constexpr auto kCodespace = std::string_view{"batchstake.close"};

  if (!authorized(capability_t::issuer, origin)) {
    return make_error(error_code::unauthorized, kCodespace,
                      "close requires the issuer capability");
  }
  if (payload.staking_total == 0) {
    return make_error(error_code::invalid_staked_currency_total_issuance,
                      kCodespace, "staking total must be greater than zero");
  }

  auto batch = read_current_batch(state);
  if (batch == std::numeric_limits<batch_id_t>::max()) {
    batchstake::common::critical("Batch index should not overflow");
  }
  auto snapshot_key = key::make_batch_snapshot_key(encoder_, batch);
  if (state.get_raw(make_bytes_view(snapshot_key)).has_value()) {
    batchstake::common::critical("Open batch already has a snapshot");
  }

  auto liquid_total = ledger_.total_issuance(state, config_.liquid_currency);
  auto snapshot = batch_snapshot_t{.version = 1,
                                   .staking_total = payload.staking_total,
                                   .liquid_total = liquid_total};
  state.put(encoder_, make_bytes_view(snapshot_key), snapshot);
  state.put(encoder_, make_bytes_view(key::make_current_batch_key(encoder_)),
            batch_id_t{batch + 1});

  auto committed = read_batch_committed_total(state, batch);
  if (payload.staking_total < committed) {
    spdlog::warn(
        "Batch {} closed with staking total {} below the {} committed to it",
        batch, to_string(payload.staking_total), to_string(committed));
  }
  spdlog::info("Batch {} processed: staking total {}, liquid total {}", batch,
               to_string(payload.staking_total), to_string(liquid_total));

  auto result = transaction_result_t{};
  result.info = "batch processed";
  result.data = encoder_.encode(batch);
  result.events.push_back(transaction_event_t{
      .version = 1,
      .type = std::string{kBatchProcessedEvent},
      .attributes = {
          make_attribute("batch", std::to_string(batch), true),
          make_attribute("staking_total", to_string(payload.staking_total)),
          make_attribute("liquid_total", to_string(liquid_total)),
          make_attribute("committed_total", to_string(committed))}});
  return result;
}

transaction_result_t engine::execute_redeem(state_t& state,
                                            const origin_t& origin,
                                            const redeem_t& payload) {
  static constexpr auto kCodespace = std::string_view{"batchstake.redeem"};

  if (!authorized(capability_t::signed_account, origin)) {
    return make_error(error_code::unauthorized, kCodespace,
                      "redeem requires a signed origin");
  }
  auto snapshot = read_batch_snapshot(state, payload.batch);
  if (!snapshot) {
    return make_error(error_code::liquid_currency_not_issued_for_this_batch,
                      kCodespace,
                      "batch " + std::to_string(payload.batch) +
                          " has not been processed");
  }

  auto staked_amount = read_pending_amount(state, payload.batch, payload.who);

  // liquid_to_mint = staked_amount * liquid_total / staking_total
  auto exchange_ratio = batchstake::arithmetic::ratio::checked_from_rational(
      snapshot->liquid_total, snapshot->staking_total);
  if (!exchange_ratio) {
    return make_error(error_code::arithmetic_overflow, kCodespace,
                      "exchange ratio is not representable");
  }
  auto liquid_to_mint = exchange_ratio->checked_mul_int(staked_amount);
  if (!liquid_to_mint) {
    return make_error(error_code::arithmetic_overflow, kCodespace,
                      "liquid amount is not representable");
  }

  auto deposited = ledger_.deposit(state, config_.liquid_currency, payload.who,
                                   *liquid_to_mint);
  if (deposited) {
    return make_error(*deposited, kCodespace, "liquid currency mint failed");
  }
  state.erase(make_bytes_view(
      key::make_pending_key(encoder_, payload.batch, payload.who)));

  spdlog::debug("Liquid currency claimed: batch {} account {} amount {}",
                payload.batch, to_hex(payload.who), to_string(*liquid_to_mint));

  auto result = transaction_result_t{};
  result.info = "liquid currency claimed";
  result.data = encoder_.encode(*liquid_to_mint);
  result.events.push_back(transaction_event_t{
      .version = 1,
      .type = std::string{kLiquidCurrencyClaimedEvent},
      .attributes = {make_attribute("batch", std::to_string(payload.batch), true),
                     make_attribute("account", to_hex(payload.who), true),
                     make_attribute("amount", to_string(*liquid_to_mint))}});
  return result;
}

transaction_result_t engine::execute_set_stash_destination(
    state_t& state,
    const origin_t& origin,
    const set_stash_destination_t& payload) {
  if (!authorized(capability_t::governance, origin)) {
    return make_error(error_code::unauthorized, "batchstake.set_stash",
                      "stash updates require the governance capability");
  }

  state.put(encoder_, make_bytes_view(key::make_stash_destination_key(encoder_)),
            payload.account);
  spdlog::info("Stash destination updated to {}", to_hex(payload.account));

  auto result = transaction_result_t{};
  result.info = "stash updated";
  result.events.push_back(transaction_event_t{
      .version = 1,
      .type = std::string{kStashUpdatedEvent},
      .attributes = {make_attribute("account", to_hex(payload.account), true)}});
  return result;
}

bool engine::authorized(const capability_t capability,
                        const origin_t& origin) const {
  if (!capability_check_) {
    return false;
  }
  return capability_check_(capability, origin);
}

batch_id_t engine::read_current_batch(const state_t& state) const {
  return state
      .get<batch_id_t>(encoder_,
                       make_bytes_view(key::make_current_batch_key(encoder_)))
      .value_or(config_.genesis_batch);
}

std::optional<account_id_t> engine::read_stash_destination(
    const state_t& state) const {
  return state.get<account_id_t>(
      encoder_, make_bytes_view(key::make_stash_destination_key(encoder_)));
}

std::optional<batch_snapshot_t> engine::read_batch_snapshot(
    const state_t& state,
    const batch_id_t batch) const {
  return state.get<batch_snapshot_t>(
      encoder_, make_bytes_view(key::make_batch_snapshot_key(encoder_, batch)));
}

amount_t engine::read_pending_amount(const state_t& state,
                                     const batch_id_t batch,
                                     const account_id_t& user) const {
  return state
      .get<amount_t>(encoder_, make_bytes_view(
                                   key::make_pending_key(encoder_, batch, user)))
      .value_or(amount_t{0});
}

amount_t engine::read_batch_committed_total(const state_t& state,
                                            const batch_id_t batch) const {
  return state
      .get<amount_t>(encoder_,
                     make_bytes_view(
                         key::make_batch_committed_key(encoder_, batch)))
      .value_or(amount_t{0});
}

std::vector<std::pair<account_id_t, amount_t>> engine::read_pending_entries(
    const batch_id_t batch) const {
  auto prefix = key::make_pending_batch_prefix(encoder_, batch);
  auto entries = std::vector<std::pair<account_id_t, amount_t>>{};
  for (const auto& [raw_key, raw_value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    if (raw_key.size() != prefix.size() + std::tuple_size_v<account_id_t>) {
      batchstake::common::critical("Malformed pending entry key");
    }
    auto account = account_id_t{};
    std::copy(std::next(std::begin(raw_key),
                        static_cast<std::ptrdiff_t>(prefix.size())),
              std::end(raw_key), std::begin(account));
    entries.emplace_back(account,
                         encoder_.decode<amount_t>(make_bytes_view(raw_value)));
  }
  return entries;
}

std::vector<event_record_t> engine::read_events(const state_t& state,
                                                const uint64_t from_id,
                                                const uint64_t to_id) const {
  auto records = std::vector<event_record_t>{};
  // Event ids start at 1.
  auto first = std::max<uint64_t>(from_id, 1);
  if (to_id < first) {
    return records;
  }
  auto last =
      to_id - first >= kMaxEventRange ? first + kMaxEventRange - 1 : to_id;
  for (auto id = first; id <= last; ++id) {
    auto record =
        state.get<event_record_t>(
            encoder_, make_bytes_view(key::make_event_key(encoder_, id)));
    if (!record) {
      break;
    }
    records.push_back(std::move(*record));
    if (id == std::numeric_limits<uint64_t>::max()) {
      break;
    }
  }
  return records;
}

std::vector<event_record_t> engine::record_events(
    state_t& state,
    const uint64_t operation,
    const std::vector<transaction_event_t>& events) {
  auto records = std::vector<event_record_t>{};
  if (events.empty()) {
    return records;
  }
  auto sequence_key = key::make_event_sequence_key(encoder_);
  auto next_id =
      state.get<uint64_t>(encoder_, make_bytes_view(sequence_key))
          .value_or(uint64_t{1});
  records.reserve(events.size());
  for (const auto& event : events) {
    auto record = event_record_t{
        .version = 1, .event_id = next_id, .operation = operation, .event = event};
    state.put(encoder_,
              make_bytes_view(key::make_event_key(encoder_, next_id)), record);
    records.push_back(std::move(record));
    ++next_id;
  }
  state.put(encoder_, make_bytes_view(sequence_key), next_id);
  return records;
}

amount_t engine::pending_amount(const batch_id_t batch,
                                const account_id_t& user) const {
  auto lock = std::scoped_lock{mutex_};
  return read_pending_amount(state_t{storage_}, batch, user);
}

std::optional<batch_snapshot_t> engine::batch_snapshot(
    const batch_id_t batch) const {
  auto lock = std::scoped_lock{mutex_};
  return read_batch_snapshot(state_t{storage_}, batch);
}

batch_id_t engine::current_batch() const {
  auto lock = std::scoped_lock{mutex_};
  return read_current_batch(state_t{storage_});
}

std::optional<account_id_t> engine::stash_destination() const {
  auto lock = std::scoped_lock{mutex_};
  return read_stash_destination(state_t{storage_});
}

std::vector<std::pair<account_id_t, amount_t>> engine::pending_entries(
    const batch_id_t batch) const {
  auto lock = std::scoped_lock{mutex_};
  return read_pending_entries(batch);
}

amount_t engine::batch_committed_total(const batch_id_t batch) const {
  auto lock = std::scoped_lock{mutex_};
  return read_batch_committed_total(state_t{storage_}, batch);
}

amount_t engine::balance(const currency_id_t currency,
                         const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.free_balance(state_t{storage_}, currency, account);
}

amount_t engine::total_issuance(const currency_id_t currency) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.total_issuance(state_t{storage_}, currency);
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return read_events(state_t{storage_}, from_id, to_id);
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.applied_operations = applied_operations_;
  result.state_root = state_root_;
  result.current_batch = read_current_batch(state_t{storage_});
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.applied_operations = applied_operations_;
  result.codespace = "batchstake.query";

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        applied_operations_, state_root_, read_current_batch(state)});
    return result;
  }
  if (path == "/batch/current") {
    result.value = encoder_.encode(read_current_batch(state));
    return result;
  }
  if (path == "/stash") {
    auto stash = read_stash_destination(state);
    if (!stash) {
      return make_query_error(query_error_code::not_found,
                              "stash destination not set", data);
    }
    result.value = encoder_.encode(*stash);
    return result;
  }
  if (path == "/batch/snapshot") {
    auto batch = encoder_.try_decode<batch_id_t>(data);
    if (!batch) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE batch id", data);
    }
    auto snapshot = read_batch_snapshot(state, *batch);
    if (!snapshot) {
      return make_query_error(query_error_code::not_found,
                              "batch not processed", data);
    }
    result.value = encoder_.encode(*snapshot);
    return result;
  }
  if (path == "/batch/pending") {
    auto decoded = encoder_.try_decode<std::tuple<batch_id_t, account_id_t>>(data);
    if (!decoded) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (batch id, account)", data);
    }
    result.value = encoder_.encode(read_pending_amount(
        state, std::get<0>(*decoded), std::get<1>(*decoded)));
    return result;
  }
  if (path == "/batch/pending_all") {
    auto batch = encoder_.try_decode<batch_id_t>(data);
    if (!batch) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE batch id", data);
    }
    result.value = encoder_.encode(read_pending_entries(*batch));
    return result;
  }
  if (path == "/batch/committed") {
    auto batch = encoder_.try_decode<batch_id_t>(data);
    if (!batch) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE batch id", data);
    }
    result.value = encoder_.encode(read_batch_committed_total(state, *batch));
    return result;
  }
  if (path == "/balance") {
    auto decoded =
        encoder_.try_decode<std::tuple<currency_id_t, account_id_t>>(data);
    if (!decoded) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (currency id, account)", data);
    }
    result.value = encoder_.encode(ledger_.free_balance(
        state, std::get<0>(*decoded), std::get<1>(*decoded)));
    return result;
  }
  if (path == "/issuance") {
    auto currency = encoder_.try_decode<currency_id_t>(data);
    if (!currency) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE currency id", data);
    }
    result.value = encoder_.encode(ledger_.total_issuance(state, *currency));
    return result;
  }
  if (path == "/events/range") {
    auto decoded = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!decoded) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (from id, to id)", data);
    }
    result.value = encoder_.encode(
        read_events(state, std::get<0>(*decoded), std::get<1>(*decoded)));
    return result;
  }

  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data);
}

void engine::set_capability_check(capability_check_t check) {
  auto lock = std::scoped_lock{mutex_};
  capability_check_ = std::move(check);
}

void engine::set_event_sink(event_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  event_sink_ = std::move(sink);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    applied_operations_ = committed->applied_operations;
    state_root_ = committed->state_root;
  } else {
    state_root_ = make_zero_hash();
  }

  auto cursor_key = key::make_current_batch_key(encoder_);
  if (!storage_.get_raw(make_bytes_view(cursor_key)).has_value()) {
    spdlog::info("Fresh database; opening genesis batch {}",
                 config_.genesis_batch);
    auto state = state_t{storage_};
    state.put(encoder_, make_bytes_view(cursor_key), config_.genesis_batch);
    state.commit();
  }
}

}  // namespace batchstake::execution
