#pragma once
#include <batchstake/schema/primitives.hpp>
#include <string_view>

namespace batchstake::blake3 {

batchstake::schema::hash32_t hash(const std::string_view& str);
batchstake::schema::hash32_t hash(const batchstake::schema::bytes_view_t& bytes);

/// BLAKE3 over `seed || material`; the rolling state root is built from it.
batchstake::schema::hash32_t fold(const batchstake::schema::hash32_t& seed,
                                  const batchstake::schema::bytes_view_t& material);

}  // namespace batchstake::blake3
