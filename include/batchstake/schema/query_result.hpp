#pragma once

#include <batchstake/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Accounting workflow: read API envelope returning SCALE-encoded state, the
// key echo and error metadata.
namespace batchstake::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  uint64_t applied_operations{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace batchstake::schema
