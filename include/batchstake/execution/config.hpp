#pragma once

#include <batchstake/schema/primitives.hpp>
#include <vector>

namespace batchstake::execution {

/// Runtime parameters of the accounting engine.
struct engine_config final {
  /// Batch that is open on a fresh database.
  batchstake::schema::batch_id_t genesis_batch{0};
  batchstake::schema::currency_id_t staking_currency{0};
  batchstake::schema::currency_id_t liquid_currency{1};
  /// Signed accounts holding the issuer capability (root always does).
  std::vector<batchstake::schema::account_id_t> issuers;
  /// Signed accounts holding the governance capability (root always does).
  std::vector<batchstake::schema::account_id_t> governors;
};

}  // namespace batchstake::execution
