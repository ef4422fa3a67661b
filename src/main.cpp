#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <boost/program_options.hpp>
#include <batchstake/currency/storage_ledger.hpp>
#include <batchstake/execution/engine.hpp>
#include <batchstake/schema/key/engine_keys.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

struct endowment final {
  batchstake::schema::currency_id_t currency{};
  batchstake::schema::account_id_t account{};
  batchstake::schema::amount_t amount{};
};

void validate_log_level(const std::string& level) {
  static constexpr auto kLevels = std::array<std::string_view, 7>{
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  if (std::find(std::begin(kLevels), std::end(kLevels), level) ==
      std::end(kLevels)) {
    throw po::validation_error{po::validation_error::invalid_option_value,
                               "log-level", level};
  }
}

void setup_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "batchstake", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

std::optional<batchstake::schema::account_id_t> parse_account(
    const std::string& hex) {
  auto account = batchstake::schema::try_make_hash32(hex);
  if (!account) {
    spdlog::error("'{}' is not a 32-byte hex account id", hex);
  }
  return account;
}

std::optional<std::vector<batchstake::schema::account_id_t>> parse_accounts(
    const po::variables_map& vm,
    const std::string& name) {
  auto accounts = std::vector<batchstake::schema::account_id_t>{};
  if (!vm.contains(name)) {
    return accounts;
  }
  for (const auto& hex : vm[name].as<std::vector<std::string>>()) {
    auto account = parse_account(hex);
    if (!account) {
      return std::nullopt;
    }
    accounts.push_back(*account);
  }
  return accounts;
}

// [currency:]account=amount; the staking currency when no currency is given.
std::optional<endowment> parse_endowment(
    const std::string& text,
    const batchstake::schema::currency_id_t default_currency) {
  auto result = endowment{.currency = default_currency};
  auto input = std::string_view{text};
  auto equals = input.find('=');
  if (equals == std::string_view::npos) {
    spdlog::error("Endowment '{}' must look like [currency:]account=amount",
                  text);
    return std::nullopt;
  }
  auto target = input.substr(0, equals);
  auto colon = target.find(':');
  if (colon != std::string_view::npos) {
    try {
      result.currency = static_cast<batchstake::schema::currency_id_t>(
          std::stoul(std::string{target.substr(0, colon)}));
    } catch (const std::exception& e) {
      spdlog::error("Endowment '{}' has a bad currency id: {}", text, e.what());
      return std::nullopt;
    }
    target.remove_prefix(colon + 1);
  }
  auto account = parse_account(std::string{target});
  if (!account) {
    return std::nullopt;
  }
  result.account = *account;
  auto amount = batchstake::schema::try_make_amount(input.substr(equals + 1));
  if (!amount) {
    spdlog::error("Endowment '{}' has a bad amount", text);
    return std::nullopt;
  }
  result.amount = *amount;
  return result;
}

// Endowments and the genesis cursor commit together, so a database that has
// its cursor never gets endowed twice.
bool apply_genesis(
    batchstake::schema::encoding::scale_encoder_t& encoder,
    batchstake::storage::storage<batchstake::storage::rocksdb_storage_tag>&
        storage,
    batchstake::currency::ledger& ledger,
    const batchstake::schema::batch_id_t genesis_batch,
    const std::vector<endowment>& endowments) {
  auto state = batchstake::currency::state_t{storage};
  for (const auto& entry : endowments) {
    auto error = ledger.deposit(state, entry.currency, entry.account,
                                entry.amount);
    if (error) {
      spdlog::error("Genesis endowment of {} to {} failed: {}",
                    batchstake::schema::to_string(entry.amount),
                    batchstake::schema::to_hex(entry.account),
                    batchstake::schema::to_string(*error));
      return false;
    }
    spdlog::info("Endowed {} with {} of currency {}",
                 batchstake::schema::to_hex(entry.account),
                 batchstake::schema::to_string(entry.amount),
                 entry.currency);
  }
  auto cursor_key = batchstake::schema::key::make_current_batch_key(encoder);
  state.put(encoder, batchstake::schema::make_bytes_view(cursor_key),
            genesis_batch);
  state.commit();
  return true;
}

std::vector<std::string> read_transaction_file(const std::string& path) {
  auto lines = std::vector<std::string>{};
  auto input = std::ifstream{path};
  if (!input) {
    spdlog::error("Cannot open transaction file {}", path);
    return lines;
  }
  auto line = std::string{};
  while (std::getline(input, line)) {
    if (line.empty() || line.front() == '#') {
      continue;
    }
    lines.push_back(line);
  }
  return lines;
}

void print_result(const batchstake::schema::transaction_result_t& result) {
  std::cout << "code=" << result.code << " log=" << result.log
            << " codespace=" << result.codespace << " info=" << result.info;
  if (!result.data.empty()) {
    std::cout << " data=" << batchstake::schema::to_hex(result.data);
  }
  std::cout << '\n';
  for (const auto& event : result.events) {
    std::cout << "  event " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config = batchstake::execution::engine_config{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"batchstake"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI-style configuration file")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("batchstake.db"),
      "RocksDB directory")(
      "genesis-batch",
      po::value<batchstake::schema::batch_id_t>(&config.genesis_batch)
          ->default_value(0),
      "Batch that is open on a fresh database")(
      "staking-currency",
      po::value<batchstake::schema::currency_id_t>(&config.staking_currency)
          ->default_value(0),
      "Currency id committed into batches")(
      "liquid-currency",
      po::value<batchstake::schema::currency_id_t>(&config.liquid_currency)
          ->default_value(1),
      "Currency id minted on redeem")(
      "issuer", po::value<std::vector<std::string>>()->composing(),
      "Account hex holding the issuer capability")(
      "governance", po::value<std::vector<std::string>>()->composing(),
      "Account hex holding the governance capability")(
      "endow", po::value<std::vector<std::string>>()->composing(),
      "Genesis balance [currency:]account=amount, fresh database only")(
      "tx,t", po::value<std::vector<std::string>>()->composing(),
      "Hex SCALE transaction to execute")(
      "tx-file", po::value<std::string>(),
      "File with one hex transaction per line")(
      "query,q", po::value<std::string>(), "Query path to run afterwards")(
      "query-data", po::value<std::string>()->default_value(""),
      "Hex query data")(
      "log-level",
      po::value<std::string>(&log_level)
          ->default_value("info")
          ->notifier(validate_log_level),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "Also write logs to this file");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input) {
        std::cerr << "cannot open config file " << path << '\n';
        return 1;
      }
      po::store(po::parse_config_file(input, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n' << description << '\n';
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  setup_logging(log_level, log_file);

  auto issuers = parse_accounts(vm, "issuer");
  auto governors = parse_accounts(vm, "governance");
  if (!issuers || !governors) {
    spdlog::shutdown();
    return 1;
  }
  config.issuers = std::move(*issuers);
  config.governors = std::move(*governors);

  auto endowments = std::vector<endowment>{};
  if (vm.contains("endow")) {
    for (const auto& text : vm["endow"].as<std::vector<std::string>>()) {
      auto parsed = parse_endowment(text, config.staking_currency);
      if (!parsed) {
        spdlog::shutdown();
        return 1;
      }
      endowments.push_back(*parsed);
    }
  }

  auto encoder = batchstake::schema::encoding::scale_encoder_t{};
  auto storage = batchstake::storage::make_storage<
      batchstake::storage::rocksdb_storage_tag>(db_path);
  auto ledger = batchstake::currency::storage_ledger{};

  auto cursor_key = batchstake::schema::key::make_current_batch_key(encoder);
  auto fresh = !storage.get_raw(batchstake::schema::make_bytes_view(cursor_key))
                    .has_value();
  if (fresh && !apply_genesis(encoder, storage, ledger, config.genesis_batch,
                              endowments)) {
    spdlog::shutdown();
    return 1;
  }
  if (!fresh && !endowments.empty()) {
    spdlog::warn("Ignoring {} endowment(s) on an existing database",
                 endowments.size());
  }

  auto engine = batchstake::execution::engine{encoder, storage, ledger, config};
  engine.set_event_sink([](const batchstake::schema::event_record_t& record) {
    spdlog::info("Event #{} (operation {}): {}", record.event_id,
                 record.operation, record.event.type);
  });

  auto transactions = std::vector<std::string>{};
  if (vm.contains("tx")) {
    transactions = vm["tx"].as<std::vector<std::string>>();
  }
  if (vm.contains("tx-file")) {
    auto from_file = read_transaction_file(vm["tx-file"].as<std::string>());
    transactions.insert(std::end(transactions), std::begin(from_file),
                        std::end(from_file));
  }

  auto rejected = size_t{0};
  for (const auto& hex : transactions) {
    if (shutdown_requested()) {
      spdlog::warn("Shutdown requested; remaining transactions not applied");
      break;
    }
    auto raw = batchstake::schema::try_from_hex(hex);
    if (!raw) {
      spdlog::error("Skipping transaction that is not valid hex");
      ++rejected;
      continue;
    }
    auto result = engine.execute(batchstake::schema::make_bytes_view(*raw));
    if (result.code != 0) {
      ++rejected;
    }
    print_result(result);
  }

  if (vm.contains("query")) {
    auto data = batchstake::schema::try_from_hex(
        vm["query-data"].as<std::string>());
    if (!data) {
      spdlog::error("Query data is not valid hex");
      spdlog::shutdown();
      return 1;
    }
    auto result = engine.query(vm["query"].as<std::string>(),
                               batchstake::schema::make_bytes_view(*data));
    std::cout << "code=" << result.code << " log=" << result.log
              << " value=" << batchstake::schema::to_hex(result.value)
              << '\n';
  }

  auto info = engine.info();
  spdlog::info("{} operation(s) applied, batch {} open, state root {}",
               info.applied_operations, info.current_batch,
               batchstake::schema::to_hex(info.state_root));

  spdlog::shutdown();
  return rejected == 0 ? 0 : 2;
}
