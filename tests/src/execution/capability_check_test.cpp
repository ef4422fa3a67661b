#include <batchstake/execution/capability_check.hpp>
#include <batchstake/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

using batchstake::schema::capability_t;

batchstake::schema::origin_t signed_by(const uint8_t seed) {
  return batchstake::schema::signed_origin_t{
      .account = batchstake::testing::make_account(seed)};
}

}  // namespace

TEST(capability_check, signed_capability_accepts_only_signed_origins) {
  auto check = batchstake::execution::make_default_capability_check({});
  EXPECT_TRUE(check(capability_t::signed_account, signed_by(1)));
  EXPECT_FALSE(check(capability_t::signed_account,
                     batchstake::schema::root_origin_t{}));
  EXPECT_FALSE(check(capability_t::signed_account,
                     batchstake::schema::none_origin_t{}));
}

TEST(capability_check, root_holds_issuer_and_governance) {
  auto check = batchstake::execution::make_default_capability_check({});
  EXPECT_TRUE(check(capability_t::issuer, batchstake::schema::root_origin_t{}));
  EXPECT_TRUE(
      check(capability_t::governance, batchstake::schema::root_origin_t{}));
  EXPECT_FALSE(check(capability_t::issuer, batchstake::schema::none_origin_t{}));
  EXPECT_FALSE(check(capability_t::issuer, signed_by(1)));
}

TEST(capability_check, configured_accounts_hold_their_roles_only) {
  auto config = batchstake::execution::engine_config{};
  config.issuers = {batchstake::testing::make_account(5)};
  config.governors = {batchstake::testing::make_account(6)};
  auto check = batchstake::execution::make_default_capability_check(config);

  EXPECT_TRUE(check(capability_t::issuer, signed_by(5)));
  EXPECT_FALSE(check(capability_t::governance, signed_by(5)));
  EXPECT_TRUE(check(capability_t::governance, signed_by(6)));
  EXPECT_FALSE(check(capability_t::issuer, signed_by(6)));
  EXPECT_FALSE(check(capability_t::issuer, signed_by(7)));
}

TEST(capability_check, capability_names_round_trip) {
  EXPECT_EQ(batchstake::schema::to_string(capability_t::governance),
            "governance");
  EXPECT_EQ(batchstake::schema::try_from_string<capability_t>("issuer"),
            capability_t::issuer);
  EXPECT_FALSE(batchstake::schema::try_from_string<capability_t>("admin")
                   .has_value());
}
