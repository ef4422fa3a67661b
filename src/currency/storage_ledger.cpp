#include <spdlog/spdlog.h>
#include <batchstake/currency/storage_ledger.hpp>
#include <batchstake/schema/key/engine_keys.hpp>

#include <limits>

namespace batchstake::currency {

namespace {

using batchstake::schema::amount_t;
using batchstake::schema::make_bytes_view;

bool add_would_overflow(const amount_t& lhs, const amount_t& rhs) {
  return lhs > (std::numeric_limits<amount_t>::max() - rhs);
}

}  // namespace

ledger_result_t storage_ledger::transfer(
    state_t& state,
    const batchstake::schema::currency_id_t currency,
    const batchstake::schema::account_id_t& from,
    const batchstake::schema::account_id_t& to,
    const amount_t& amount) {
  if (amount == 0 || from == to) {
    return std::nullopt;
  }

  auto from_balance = free_balance(state, currency, from);
  if (from_balance < amount) {
    spdlog::debug("Transfer of {} (currency {}) refused: balance {}",
                  batchstake::schema::to_string(amount), currency,
                  batchstake::schema::to_string(from_balance));
    return batchstake::schema::error_code::insufficient_balance;
  }
  auto to_balance = free_balance(state, currency, to);
  if (add_would_overflow(to_balance, amount)) {
    return batchstake::schema::error_code::balance_overflow;
  }

  auto from_key =
      batchstake::schema::key::make_balance_key(encoder_, currency, from);
  auto to_key =
      batchstake::schema::key::make_balance_key(encoder_, currency, to);
  state.put(encoder_, make_bytes_view(from_key),
            amount_t{from_balance - amount});
  state.put(encoder_, make_bytes_view(to_key),
            amount_t{to_balance + amount});
  return std::nullopt;
}

ledger_result_t storage_ledger::deposit(
    state_t& state,
    const batchstake::schema::currency_id_t currency,
    const batchstake::schema::account_id_t& to,
    const amount_t& amount) {
  if (amount == 0) {
    return std::nullopt;
  }

  auto issuance = total_issuance(state, currency);
  auto balance = free_balance(state, currency, to);
  if (add_would_overflow(issuance, amount) ||
      add_would_overflow(balance, amount)) {
    return batchstake::schema::error_code::balance_overflow;
  }

  auto issuance_key =
      batchstake::schema::key::make_issuance_key(encoder_, currency);
  auto balance_key =
      batchstake::schema::key::make_balance_key(encoder_, currency, to);
  state.put(encoder_, make_bytes_view(issuance_key),
            amount_t{issuance + amount});
  state.put(encoder_, make_bytes_view(balance_key),
            amount_t{balance + amount});
  return std::nullopt;
}

amount_t storage_ledger::total_issuance(
    const state_t& state,
    const batchstake::schema::currency_id_t currency) const {
  auto key = batchstake::schema::key::make_issuance_key(encoder_, currency);
  return state.get<amount_t>(encoder_, make_bytes_view(key))
      .value_or(amount_t{0});
}

amount_t storage_ledger::free_balance(
    const state_t& state,
    const batchstake::schema::currency_id_t currency,
    const batchstake::schema::account_id_t& account) const {
  auto key =
      batchstake::schema::key::make_balance_key(encoder_, currency, account);
  return state.get<amount_t>(encoder_, make_bytes_view(key))
      .value_or(amount_t{0});
}

}  // namespace batchstake::currency
