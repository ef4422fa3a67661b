#pragma once
#include <batchstake/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace batchstake::storage {

using key_value_entry_t =
    std::pair<batchstake::schema::bytes_t, batchstake::schema::bytes_t>;

/// Pending key writes; std::nullopt marks a delete.
using write_set_t = std::map<batchstake::schema::bytes_t,
                             std::optional<batchstake::schema::bytes_t>>;

/// Engine checkpoint persisted alongside every applied operation.
struct committed_state final {
  uint64_t applied_operations{};
  batchstake::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const batchstake::schema::bytes_view_t& key) const;

  /// Return raw value bytes at key, or std::nullopt when missing.
  std::optional<batchstake::schema::bytes_t> get_raw(
      const batchstake::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const batchstake::schema::bytes_view_t& key,
           const T& value);

  /// Remove key; removing a missing key is not an error.
  void erase(const batchstake::schema::bytes_view_t& key);

  /// Apply every write in the set as one atomic batch.
  void apply(const write_set_t& writes);

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint.
  void save_committed_state(const committed_state& state);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const batchstake::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace batchstake::storage
