#pragma once

#include <batchstake/schema/primitives.hpp>
#include <optional>
#include <variant>

// Schema type: origin.
// Accounting workflow: caller context handed over by the host after it has
// authenticated the transaction. The engine never verifies signatures.
namespace batchstake::schema {

struct none_origin_t final {};

struct signed_origin_t final {
  account_id_t account{};
};

struct root_origin_t final {};

using origin_t = std::variant<none_origin_t, signed_origin_t, root_origin_t>;

/// Account behind a signed origin, std::nullopt for none/root.
inline std::optional<account_id_t> signed_account(const origin_t& origin) {
  if (const auto* value = std::get_if<signed_origin_t>(&origin)) {
    return value->account;
  }
  return std::nullopt;
}

}  // namespace batchstake::schema
