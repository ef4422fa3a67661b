#pragma once

#include <batchstake/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace batchstake::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t version{1};
  std::string data{"batchstake"};
  std::string app_version{"0.1.0"};
  uint64_t applied_operations{};
  hash32_t state_root{};
  batch_id_t current_batch{};
};

using app_info_t = app_info<1>;

}  // namespace batchstake::schema
