#include <blake3.h>
#include <batchstake/blake3/hash.hpp>

namespace batchstake::blake3 {

batchstake::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = batchstake::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

batchstake::schema::hash32_t hash(
    const batchstake::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = batchstake::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

batchstake::schema::hash32_t fold(
    const batchstake::schema::hash32_t& seed,
    const batchstake::schema::bytes_view_t& material) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, seed.data(), seed.size());
  blake3_hasher_update(&hasher, material.data(), material.size());
  auto output = batchstake::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace batchstake::blake3
