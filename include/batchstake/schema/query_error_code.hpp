#pragma once

#include <cstdint>

// Schema type: query error code.
// Accounting workflow: read-path failure taxonomy for the query router.
namespace batchstake::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
};

}  // namespace batchstake::schema
