#pragma once
#include <batchstake/schema/primitives.hpp>
#include <batchstake/storage/storage.hpp>
#include <optional>
#include <utility>

namespace batchstake::storage {

/// Unit of work over a storage backend.
///
/// Reads see this overlay's own writes first, then the backend. Nothing reaches
/// the backend until `commit`, which hands the whole write set to the backend
/// as one atomic batch. Destroying an uncommitted overlay discards its writes.
/// Not thread safe; the owner serializes access.
template <typename Library>
class overlay final {
 public:
  explicit overlay(storage<Library>& base) : base_{base} {}

  overlay(const overlay&) = delete;
  overlay& operator=(const overlay&) = delete;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const batchstake::schema::bytes_view_t& key) const {
    auto value = get_raw(key);
    if (!value) {
      return std::nullopt;
    }
    return {encoder.template decode<T>(
        batchstake::schema::bytes_view_t{value->data(), value->size()})};
  }

  std::optional<batchstake::schema::bytes_t> get_raw(
      const batchstake::schema::bytes_view_t& key) const {
    auto it = writes_.find(batchstake::schema::make_bytes(key));
    if (it != std::end(writes_)) {
      return it->second;
    }
    return base_.get_raw(key);
  }

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const batchstake::schema::bytes_view_t& key,
           const T& value) {
    put_raw(key, encoder.encode(value));
  }

  void put_raw(const batchstake::schema::bytes_view_t& key,
               batchstake::schema::bytes_t value) {
    writes_.insert_or_assign(batchstake::schema::make_bytes(key),
                             std::optional{std::move(value)});
  }

  void erase(const batchstake::schema::bytes_view_t& key) {
    writes_.insert_or_assign(batchstake::schema::make_bytes(key),
                             std::nullopt);
  }

  const write_set_t& writes() const { return writes_; }
  bool empty() const { return writes_.empty(); }

  void commit() {
    base_.apply(writes_);
    writes_.clear();
  }

  void discard() { writes_.clear(); }

 private:
  storage<Library>& base_;
  write_set_t writes_;
};

}  // namespace batchstake::storage
