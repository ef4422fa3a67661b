#pragma once

#include <batchstake/currency/ledger.hpp>
#include <batchstake/schema/encoding/scale/encoder.hpp>

namespace batchstake::currency {

/// Ledger that keeps balances and issuance in the engine's own key space
/// (`SYS|STATE|BALANCE|`, `SYS|STATE|ISSUANCE|`).
class storage_ledger final : public ledger {
 public:
  ledger_result_t transfer(state_t& state,
                           batchstake::schema::currency_id_t currency,
                           const batchstake::schema::account_id_t& from,
                           const batchstake::schema::account_id_t& to,
                           const batchstake::schema::amount_t& amount) override;

  ledger_result_t deposit(state_t& state,
                          batchstake::schema::currency_id_t currency,
                          const batchstake::schema::account_id_t& to,
                          const batchstake::schema::amount_t& amount) override;

  batchstake::schema::amount_t total_issuance(
      const state_t& state,
      batchstake::schema::currency_id_t currency) const override;

  batchstake::schema::amount_t free_balance(
      const state_t& state,
      batchstake::schema::currency_id_t currency,
      const batchstake::schema::account_id_t& account) const override;

 private:
  mutable batchstake::schema::encoding::scale_encoder_t encoder_;
};

}  // namespace batchstake::currency
