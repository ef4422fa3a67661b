#include <gtest/gtest.h>
#include <batchstake/schema/encoding/scale/encoder.hpp>
#include <batchstake/schema/primitives.hpp>
#include <batchstake/testing/common.hpp>
#include <batchstake/testing/process.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>

#ifndef BATCHSTAKE_BINARY_PATH
#define BATCHSTAKE_BINARY_PATH ""
#endif

namespace {

using encoder_t = batchstake::schema::encoding::scale_encoder_t;
using batchstake::testing::make_account;
using batchstake::testing::run_capture;
using batchstake::testing::shell_quote;

std::string binary_path() {
  return std::string{BATCHSTAKE_BINARY_PATH};
}

bool binary_available() {
  auto binary = binary_path();
  return !binary.empty() && std::filesystem::exists(binary);
}

// Value printed for `--query`, decoded from its hex.
batchstake::schema::bytes_t query_value(const std::string& db_path,
                                        const std::string& args) {
  auto command = shell_quote(binary_path()) + " --log-level off --db-path " +
                 shell_quote(db_path) + " " + args;
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;

  static constexpr auto kValueMarker = std::string_view{" value="};
  auto marker = output.find(kValueMarker);
  EXPECT_NE(marker, std::string::npos) << output;
  if (marker == std::string::npos) {
    return {};
  }
  auto begin = marker + kValueMarker.size();
  auto end = output.find_first_of(" \n", begin);
  auto value = batchstake::schema::try_from_hex(
      std::string_view{output}.substr(begin, end - begin));
  EXPECT_TRUE(value.has_value()) << output;
  return value.value_or(batchstake::schema::bytes_t{});
}

}  // namespace

TEST(batchstake_cli, genesis_endowment_applies_once) {
  if (!binary_available()) {
    GTEST_SKIP() << "batchstake binary not available: " << binary_path();
  }
  auto encoder = encoder_t{};
  auto db_path = batchstake::testing::make_db_path("batchstake_cli_genesis");
  auto user = make_account(9);
  auto endow = "--endow " + batchstake::schema::to_hex(user) + "=100";
  auto balance_data = batchstake::schema::to_hex(encoder.encode(
      std::tuple{batchstake::schema::currency_id_t{0}, user}));
  auto balance_query =
      endow + " --query /balance --query-data " + balance_data;

  auto first = query_value(db_path, "--genesis-batch 5 " + balance_query);
  EXPECT_EQ(encoder.decode<batchstake::schema::amount_t>(
                batchstake::schema::make_bytes_view(first)),
            batchstake::schema::amount_t{100});

  auto cursor = query_value(db_path, "--query /batch/current");
  EXPECT_EQ(encoder.decode<batchstake::schema::batch_id_t>(
                batchstake::schema::make_bytes_view(cursor)),
            5u);

  auto second = query_value(db_path, balance_query);
  EXPECT_EQ(encoder.decode<batchstake::schema::amount_t>(
                batchstake::schema::make_bytes_view(second)),
            batchstake::schema::amount_t{100});

  batchstake::testing::remove_path(db_path);
}

TEST(batchstake_cli, unknown_log_level_is_rejected) {
  if (!binary_available()) {
    GTEST_SKIP() << "batchstake binary not available: " << binary_path();
  }
  auto db_path = batchstake::testing::make_db_path("batchstake_cli_level");
  auto command = shell_quote(binary_path()) + " --log-level verbose --db-path " +
                 shell_quote(db_path) + " 2>&1";
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 1) << output;
  EXPECT_NE(output.find("log-level"), std::string::npos) << output;
  EXPECT_FALSE(std::filesystem::exists(db_path));
}
