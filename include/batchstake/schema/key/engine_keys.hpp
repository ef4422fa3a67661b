#pragma once

#include <batchstake/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Accounting workflow: canonical key prefixes and key codecs for batch state,
// currency balances, the event log and committed engine state.
namespace batchstake::schema::key {

inline constexpr std::string_view kPendingKeyPrefix{"SYS|STATE|PENDING|"};
inline constexpr std::string_view kBatchSnapshotKeyPrefix{
    "SYS|STATE|BATCH_SNAPSHOT|"};
inline constexpr std::string_view kBatchCommittedKeyPrefix{
    "SYS|STATE|BATCH_COMMITTED|"};
inline constexpr std::string_view kCurrentBatchKeyPrefix{
    "SYS|STATE|CURRENT_BATCH|"};
inline constexpr std::string_view kStashDestinationKeyPrefix{
    "SYS|STATE|STASH|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kIssuanceKeyPrefix{"SYS|STATE|ISSUANCE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kCommittedStateKey{"SYS|APP|COMMITTED"};

template <typename Encoder, typename T>
batchstake::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                              std::string_view prefix,
                                              const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
batchstake::schema::bytes_t make_pending_key(
    Encoder& encoder,
    const batchstake::schema::batch_id_t batch,
    const batchstake::schema::account_id_t& user) {
  return make_prefixed_key(encoder, kPendingKeyPrefix, std::tuple{batch, user});
}

/// Prefix shared by every pending entry of one batch.
template <typename Encoder>
batchstake::schema::bytes_t make_pending_batch_prefix(
    Encoder& encoder,
    const batchstake::schema::batch_id_t batch) {
  return make_prefixed_key(encoder, kPendingKeyPrefix, batch);
}

template <typename Encoder>
batchstake::schema::bytes_t make_batch_snapshot_key(
    Encoder& encoder,
    const batchstake::schema::batch_id_t batch) {
  return make_prefixed_key(encoder, kBatchSnapshotKeyPrefix, batch);
}

template <typename Encoder>
batchstake::schema::bytes_t make_batch_committed_key(
    Encoder& encoder,
    const batchstake::schema::batch_id_t batch) {
  return make_prefixed_key(encoder, kBatchCommittedKeyPrefix, batch);
}

template <typename Encoder>
batchstake::schema::bytes_t make_current_batch_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kCurrentBatchKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
batchstake::schema::bytes_t make_stash_destination_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kStashDestinationKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
batchstake::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const batchstake::schema::currency_id_t currency,
    const batchstake::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{currency, account});
}

template <typename Encoder>
batchstake::schema::bytes_t make_issuance_key(
    Encoder& encoder,
    const batchstake::schema::currency_id_t currency) {
  return make_prefixed_key(encoder, kIssuanceKeyPrefix, currency);
}

template <typename Encoder>
batchstake::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
batchstake::schema::bytes_t make_event_key(Encoder& encoder,
                                           uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

}  // namespace batchstake::schema::key
