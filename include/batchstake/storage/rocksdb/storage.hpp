#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <batchstake/common/critical.hpp>
#include <batchstake/schema/encoding/scale/encoder.hpp>
#include <batchstake/schema/key/engine_keys.hpp>
#include <batchstake/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>
#include <tuple>

namespace batchstake::storage {

namespace detail {

using encoder_t = batchstake::schema::encoding::scale_encoder_t;

inline batchstake::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const batchstake::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const batchstake::schema::bytes_view_t& key) const;

  std::optional<batchstake::schema::bytes_t> get_raw(
      const batchstake::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const batchstake::schema::bytes_view_t& key,
           const T& value);

  void erase(const batchstake::schema::bytes_view_t& key);
  void apply(const write_set_t& writes);
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state);
  std::vector<key_value_entry_t> list_by_prefix(
      const batchstake::schema::bytes_view_t& prefix) const;

  /// Key/value row under which a checkpoint is stored.
  static key_value_entry_t make_committed_state_entry(
      const committed_state& state);
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const batchstake::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      batchstake::schema::bytes_view_t{value->data(), value->size()})};
}

inline std::optional<batchstake::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const batchstake::schema::bytes_view_t& key) const {
  if (!database) {
    batchstake::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    batchstake::common::critical("Failed to get value from RocksDB: {}", status.ToString());
  }
  return batchstake::schema::bytes_t{std::begin(value), std::end(value)};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const batchstake::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    batchstake::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(batchstake::schema::bytes_view_t{encoded_value.data(),
                                                        encoded_value.size()}));
  if (!status.ok()) {
    batchstake::common::critical("Failed to put value into RocksDB: {}", status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::erase(
    const batchstake::schema::bytes_view_t& key) {
  if (!database) {
    batchstake::common::critical("RocksDB database is not initialized");
  }
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    batchstake::common::critical("Failed to delete key from RocksDB: {}", status.ToString());
  }
}

inline void storage<rocksdb_storage_tag>::apply(const write_set_t& writes) {
  if (!database) {
    batchstake::common::critical("RocksDB database is not initialized");
  }
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto key_slice = detail::to_slice(
        batchstake::schema::bytes_view_t{key.data(), key.size()});
    if (value.has_value()) {
      auto put_status = batch.Put(
          key_slice, detail::to_slice(batchstake::schema::bytes_view_t{
                         value->data(), value->size()}));
      if (!put_status.ok()) {
        batchstake::common::critical("failed staging write batch put");
      }
    } else {
      auto delete_status = batch.Delete(key_slice);
      if (!delete_status.ok()) {
        batchstake::common::critical("failed staging write batch delete");
      }
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    batchstake::common::critical("Failed to commit write batch: {}", write_status.ToString());
  }
}

inline key_value_entry_t
storage<rocksdb_storage_tag>::make_committed_state_entry(
    const committed_state& state) {
  auto encoder = detail::encoder_t{};
  return key_value_entry_t{
      batchstake::schema::make_bytes(batchstake::schema::key::kCommittedStateKey),
      encoder.encode(std::tuple{state.applied_operations, state.state_root})};
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto key = batchstake::schema::make_bytes(
      batchstake::schema::key::kCommittedStateKey);
  auto committed_raw =
      get_raw(batchstake::schema::bytes_view_t{key.data(), key.size()});
  if (!committed_raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, batchstake::schema::hash32_t>>(
          batchstake::schema::bytes_view_t{committed_raw->data(),
                                           committed_raw->size()});
  if (!decoded.has_value()) {
    batchstake::common::critical("failed to decode committed state");
  }

  auto state = committed_state{};
  state.applied_operations = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) {
  auto [key, value] = make_committed_state_entry(state);
  auto writes = write_set_t{};
  writes.emplace(std::move(key), std::move(value));
  apply(writes);
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const batchstake::schema::bytes_view_t& prefix) const {
  if (!database) {
    batchstake::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    batchstake::common::critical("Prefix scan failed: {}", iterator->status().ToString());
  }
  return entries;
}

}  // namespace batchstake::storage
