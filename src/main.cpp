#include <csignal>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/schema/registry_event.hpp>
#include <algorithm>
#include <atomic>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using encoder_t = tessera::schema::encoding::encoder<
    tessera::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void print_block(const uint64_t height,
                 const tessera::schema::block_result_t& block) {
  for (size_t i = 0; i < block.tx_results.size(); ++i) {
    const auto& result = block.tx_results[i];
    std::cout << height << ' ' << i << ' ' << result.code << ' '
              << (result.codespace.empty() ? "-" : result.codespace) << ' '
              << (result.log.empty() ? "ok" : result.log) << '\n';
    for (const auto& event : result.events) {
      std::cout << "  event " << tessera::schema::event_type(event) << '\n';
    }
  }
  std::cout << "state_root "
            << tessera::schema::to_hex(tessera::schema::bytes_view_t{
                   block.state_root.data(), block.state_root.size()})
            << '\n';
}

void run_query(tessera::execution::engine& engine, std::istringstream& words) {
  auto path = std::string{};
  auto key_hex = std::string{};
  words >> path >> key_hex;
  auto key = tessera::schema::try_from_hex(key_hex);
  if (!key) {
    spdlog::warn("Ignoring query with malformed hex key");
    return;
  }
  auto result = engine.query(
      path, tessera::schema::bytes_view_t{key->data(), key->size()});
  std::cout << "query " << path << ' ' << result.code << ' '
            << (result.log.empty() ? "ok" : result.log) << ' '
            << tessera::schema::to_hex(tessera::schema::bytes_view_t{
                   result.value.data(), result.value.size()})
            << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_path = std::string{};
  auto start_height = uint64_t{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Tessera"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with the options below")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("tessera.db"),
      "RocksDB directory for registry state")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "Also write logs to this file")(
      "start-height", po::value<uint64_t>(&start_height)->default_value(0),
      "Height of the first block when the store is empty");
  po::store(po::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    auto config = std::ifstream{vm["config"].as<std::string>()};
    if (!config) {
      std::cerr << "cannot open config file " << vm["config"].as<std::string>()
                << '\n';
      return 1;
    }
    po::store(po::parse_config_file(config, description), vm);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    std::cout << "Reads one block per stdin line: hex transactions separated "
                 "by spaces,\nor 'query <path> [hex key]'.\n";
    return 0;
  }

  auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != "off") {
    std::cerr << "unknown log level " << log_level << '\n';
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "tessera", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);

  auto encoder = encoder_t{};
  auto storage =
      tessera::storage::make_storage<tessera::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = tessera::execution::engine{encoder, storage};

  auto info = engine.info();
  auto height = std::max<uint64_t>(
      static_cast<uint64_t>(info.last_block_height) + 1, start_height);

  auto line = std::string{};
  while (!shutdown_requested() && std::getline(std::cin, line)) {
    auto words = std::istringstream{line};
    auto first = std::string{};
    if (!(words >> first)) {
      continue;
    }
    if (first == "query") {
      run_query(engine, words);
      continue;
    }

    auto txs = std::vector<tessera::schema::bytes_t>{};
    auto word = first;
    do {
      auto tx = tessera::schema::try_from_hex(word);
      if (!tx) {
        spdlog::warn("Skipping malformed hex transaction in block {}", height);
        continue;
      }
      txs.push_back(std::move(*tx));
    } while (words >> word);

    auto block = engine.finalize_block(height, txs);
    engine.commit();
    print_block(height, block);
    ++height;
  }

  spdlog::info("Shutting down at height {}", engine.info().last_block_height);
  spdlog::shutdown();
  return 0;
}
