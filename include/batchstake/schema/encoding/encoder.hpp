#pragma once
#include <batchstake/schema/primitives.hpp>
#include <optional>
#include <span>

namespace batchstake::schema::encoding {

// Encoder front end selected at build time by tag. Values, storage keys and
// the transaction envelope all go through the same codec so that a key built
// by a client tool matches the key the engine reads.
template <typename Library>
struct encoder {
  template <typename T>
  batchstake::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, batchstake::schema::bytes_t& out);

  template <typename T>
  T decode(const batchstake::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const batchstake::schema::bytes_view_t& bytes);
};

}  // namespace batchstake::schema::encoding
