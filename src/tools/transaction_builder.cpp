#include <boost/program_options.hpp>
#include <batchstake/common/critical.hpp>
#include <batchstake/schema/encoding/scale/encoder.hpp>
#include <batchstake/schema/primitives.hpp>
#include <batchstake/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = batchstake::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

batchstake::schema::hash32_t get_hash32(const po::variables_map& vm,
                                        const std::string& name) {
  if (!vm.contains(name)) {
    batchstake::common::critical("missing required account argument");
  }
  auto hash = batchstake::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    batchstake::common::critical("account must be 32 bytes of hex");
  }
  return *hash;
}

batchstake::schema::amount_t get_amount(const po::variables_map& vm,
                                        const std::string& name) {
  auto amount =
      batchstake::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    batchstake::common::critical("amount must be a base-10 u128");
  }
  return *amount;
}

// none | root | signed:<account hex>
batchstake::schema::origin_t parse_origin(const std::string& origin) {
  if (origin == "none") {
    return batchstake::schema::none_origin_t{};
  }
  if (origin == "root") {
    return batchstake::schema::root_origin_t{};
  }
  static constexpr auto kSignedPrefix = std::string_view{"signed:"};
  if (std::string_view{origin}.starts_with(kSignedPrefix)) {
    auto account = batchstake::schema::try_make_hash32(
        std::string_view{origin}.substr(kSignedPrefix.size()));
    if (!account) {
      batchstake::common::critical("signed origin needs a 32-byte hex account");
    }
    return batchstake::schema::signed_origin_t{.account = *account};
  }
  batchstake::common::critical("origin must be none|root|signed:<hex>");
}

batchstake::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "commit") {
    return batchstake::schema::commit_stake_t{.amount =
                                                  get_amount(vm, "amount")};
  }
  if (payload == "close") {
    return batchstake::schema::close_batch_t{
        .staking_total = get_amount(vm, "staking-total")};
  }
  if (payload == "redeem") {
    return batchstake::schema::redeem_t{
        .who = get_hash32(vm, "who"),
        .batch = vm["batch"].as<batchstake::schema::batch_id_t>()};
  }
  if (payload == "set_stash") {
    return batchstake::schema::set_stash_destination_t{
        .account = get_hash32(vm, "account")};
  }
  batchstake::common::critical("unsupported payload type");
}

batchstake::schema::bytes_t build_query_data(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  auto batch = vm["batch"].as<batchstake::schema::batch_id_t>();
  if (path == "/engine/info" || path == "/batch/current" || path == "/stash") {
    return {};
  }
  if (path == "/batch/snapshot" || path == "/batch/committed" ||
      path == "/batch/pending_all") {
    return encoder.encode(batch);
  }
  if (path == "/batch/pending") {
    return encoder.encode(std::tuple{batch, get_hash32(vm, "who")});
  }
  if (path == "/balance") {
    return encoder.encode(
        std::tuple{vm["currency"].as<batchstake::schema::currency_id_t>(),
                   get_hash32(vm, "account")});
  }
  if (path == "/issuance") {
    return encoder.encode(
        vm["currency"].as<batchstake::schema::currency_id_t>());
  }
  if (path == "/events/range") {
    return encoder.encode(
        std::tuple{vm["from-id"].as<uint64_t>(), vm["to-id"].as<uint64_t>()});
  }
  batchstake::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction --payload "
               "commit|close|redeem|set_stash [options]\n"
            << "  transaction_builder query-data --path <path> [options]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "transaction|query-data")(
      "payload", po::value<std::string>(),
      "commit|close|redeem|set_stash")(
      "origin", po::value<std::string>()->default_value("none"),
      "none|root|signed:<account hex>")(
      "path", po::value<std::string>(), "query path")(
      "amount", po::value<std::string>()->default_value("0"),
      "commit amount")("staking-total",
                       po::value<std::string>()->default_value("0"),
                       "close staking total")(
      "who", po::value<std::string>(), "redeem beneficiary account hex")(
      "account", po::value<std::string>(), "stash or balance account hex")(
      "batch", po::value<batchstake::schema::batch_id_t>()->default_value(0),
      "batch id")("currency",
                  po::value<batchstake::schema::currency_id_t>()
                      ->default_value(0),
                  "currency id")(
      "from-id", po::value<uint64_t>()->default_value(1), "first event id")(
      "to-id", po::value<uint64_t>()->default_value(1), "last event id");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      batchstake::common::critical("transaction mode requires --payload");
    }
    auto transaction = batchstake::schema::transaction_t{
        .version = 1,
        .origin = parse_origin(vm["origin"].as<std::string>()),
        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << batchstake::schema::to_hex(encoded) << '\n';
    return 0;
  }

  if (command == "query-data") {
    if (!vm.contains("path")) {
      batchstake::common::critical("query-data mode requires --path");
    }
    auto data = build_query_data(vm);
    std::cout << batchstake::schema::to_hex(data) << '\n';
    return 0;
  }

  batchstake::common::critical("command must be transaction|query-data");
}
