#include <gtest/gtest.h>
#include <batchstake/schema/encoding/scale/encoder.hpp>
#include <batchstake/schema/primitives.hpp>
#include <batchstake/schema/transaction.hpp>
#include <batchstake/testing/common.hpp>
#include <batchstake/testing/process.hpp>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>

#ifndef BATCHSTAKE_TRANSACTION_BUILDER_PATH
#define BATCHSTAKE_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = batchstake::schema::encoding::scale_encoder_t;
using batchstake::testing::make_account;
using batchstake::testing::run_capture;
using batchstake::testing::shell_quote;
using batchstake::testing::trim_ascii_whitespace;

std::string builder_path() {
  return std::string{BATCHSTAKE_TRANSACTION_BUILDER_PATH};
}

bool builder_available() {
  auto builder = builder_path();
  return !builder.empty() && std::filesystem::exists(builder);
}

batchstake::schema::bytes_t run_builder(const std::string_view args) {
  auto command = shell_quote(builder_path()) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  auto bytes = batchstake::schema::try_from_hex(trim_ascii_whitespace(output));
  EXPECT_TRUE(bytes.has_value()) << "not hex: " << output;
  return bytes.value_or(batchstake::schema::bytes_t{});
}

batchstake::schema::transaction_t run_transaction(const std::string& args) {
  auto encoder = encoder_t{};
  auto bytes = run_builder("transaction " + args);
  auto tx = encoder.try_decode<batchstake::schema::transaction_t>(
      batchstake::schema::make_bytes_view(bytes));
  EXPECT_TRUE(tx.has_value());
  return tx.value_or(batchstake::schema::transaction_t{});
}

}  // namespace

TEST(transaction_builder, commit_carries_signed_origin_and_amount) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction_builder binary not available: "
                 << builder_path();
  }
  auto user = make_account(7);
  auto tx = run_transaction("--payload commit --origin signed:" +
                            batchstake::schema::to_hex(user) +
                            " --amount 340282366920938463463374607431768211455");

  EXPECT_EQ(tx.version, 1u);
  const auto* origin =
      std::get_if<batchstake::schema::signed_origin_t>(&tx.origin);
  ASSERT_NE(origin, nullptr);
  EXPECT_EQ(origin->account, user);
  const auto* payload =
      std::get_if<batchstake::schema::commit_stake_t>(&tx.payload);
  ASSERT_NE(payload, nullptr);
  EXPECT_EQ(payload->amount,
            std::numeric_limits<batchstake::schema::amount_t>::max());
}

TEST(transaction_builder, close_redeem_and_stash_payloads_decode) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction_builder binary not available: "
                 << builder_path();
  }

  auto close = run_transaction("--payload close --origin root "
                               "--staking-total 2000");
  EXPECT_TRUE(std::holds_alternative<batchstake::schema::root_origin_t>(
      close.origin));
  const auto* close_payload =
      std::get_if<batchstake::schema::close_batch_t>(&close.payload);
  ASSERT_NE(close_payload, nullptr);
  EXPECT_EQ(close_payload->staking_total, batchstake::schema::amount_t{2000});

  auto who = make_account(3);
  auto redeem = run_transaction(
      "--payload redeem --origin signed:" +
      batchstake::schema::to_hex(make_account(4)) +
      " --who " + batchstake::schema::to_hex(who) + " --batch 9");
  const auto* redeem_payload =
      std::get_if<batchstake::schema::redeem_t>(&redeem.payload);
  ASSERT_NE(redeem_payload, nullptr);
  EXPECT_EQ(redeem_payload->who, who);
  EXPECT_EQ(redeem_payload->batch, 9u);
  EXPECT_EQ(batchstake::schema::signed_account(redeem.origin)
                .value_or(batchstake::schema::account_id_t{}),
            make_account(4));

  auto stash = make_account(100);
  auto set_stash = run_transaction("--payload set_stash --account " +
                                   batchstake::schema::to_hex(stash));
  EXPECT_TRUE(std::holds_alternative<batchstake::schema::none_origin_t>(
      set_stash.origin));
  const auto* stash_payload =
      std::get_if<batchstake::schema::set_stash_destination_t>(
          &set_stash.payload);
  ASSERT_NE(stash_payload, nullptr);
  EXPECT_EQ(stash_payload->account, stash);
}

TEST(transaction_builder, query_data_matches_route_layout) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction_builder binary not available: "
                 << builder_path();
  }
  auto encoder = encoder_t{};
  auto who = make_account(5);

  auto pending = run_builder("query-data --path /batch/pending --batch 3 --who " +
                             batchstake::schema::to_hex(who));
  EXPECT_EQ(pending, encoder.encode(std::tuple{
                         batchstake::schema::batch_id_t{3}, who}));

  auto range = run_builder("query-data --path /events/range --from-id 2 "
                           "--to-id 9");
  EXPECT_EQ(range, encoder.encode(std::tuple{uint64_t{2}, uint64_t{9}}));

  auto balance = run_builder("query-data --path /balance --currency 1 "
                             "--account " +
                             batchstake::schema::to_hex(who));
  EXPECT_EQ(balance, encoder.encode(std::tuple{
                         batchstake::schema::currency_id_t{1}, who}));

  auto all_pending =
      run_builder("query-data --path /batch/pending_all --batch 4");
  EXPECT_EQ(all_pending, encoder.encode(batchstake::schema::batch_id_t{4}));

  EXPECT_TRUE(run_builder("query-data --path /engine/info").empty());
}

TEST(transaction_builder, rejects_malformed_origin) {
  if (!builder_available()) {
    GTEST_SKIP() << "transaction_builder binary not available: "
                 << builder_path();
  }
  auto command = shell_quote(builder_path()) +
                 " transaction --payload commit --origin signed:abcd 2>&1";
  auto [exit_code, output] = run_capture(command);
  EXPECT_NE(exit_code, 0) << output;
}
