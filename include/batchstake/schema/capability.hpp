#pragma once

#include <batchstake/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: capability.
// Accounting workflow: the three authorization gates an operation can require
// of its origin.
namespace batchstake::schema {

enum class capability_t : uint8_t {
  signed_account = 0,
  issuer = 1,
  governance = 2,
};

inline constexpr auto kCapabilityMappings = std::array{
    std::pair<std::string_view, capability_t>{"signed",
                                              capability_t::signed_account},
    std::pair<std::string_view, capability_t>{"issuer", capability_t::issuer},
    std::pair<std::string_view, capability_t>{"governance",
                                              capability_t::governance}};

template <>
inline std::optional<capability_t> try_from_string<capability_t>(
    const std::string_view value) {
  return from_string(value, kCapabilityMappings);
}

inline constexpr std::string_view to_string(const capability_t value) {
  return to_string(value, kCapabilityMappings).value_or("unknown");
}

}  // namespace batchstake::schema
