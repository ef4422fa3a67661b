#include <batchstake/execution/capability_check.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace batchstake::execution {

namespace {

bool is_member(const std::vector<batchstake::schema::account_id_t>& accounts,
               const batchstake::schema::origin_t& origin) {
  auto account = batchstake::schema::signed_account(origin);
  if (!account) {
    return false;
  }
  return std::find(std::begin(accounts), std::end(accounts), *account) !=
         std::end(accounts);
}

bool is_root(const batchstake::schema::origin_t& origin) {
  return std::holds_alternative<batchstake::schema::root_origin_t>(origin);
}

}  // namespace

capability_check_t make_default_capability_check(const engine_config& config) {
  return [issuers = config.issuers, governors = config.governors](
             const batchstake::schema::capability_t capability,
             const batchstake::schema::origin_t& origin) {
    switch (capability) {
      case batchstake::schema::capability_t::signed_account:
        return batchstake::schema::signed_account(origin).has_value();
      case batchstake::schema::capability_t::issuer:
        return is_root(origin) || is_member(issuers, origin);
      case batchstake::schema::capability_t::governance:
        return is_root(origin) || is_member(governors, origin);
    }
    return false;
  };
}

}  // namespace batchstake::execution
