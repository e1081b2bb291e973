#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <steward/execution/engine.hpp>
#include <steward/substrate/server.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};
  auto strict_crypto = true;
  auto config = steward::execution::engine_config{};

  namespace po = boost::program_options;
  auto description = po::options_description{"Steward"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "Config file with the same keys as the command line")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26658"),
      "IP:Port for the substrate server")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("steward-data"),
      "RocksDB directory")(
      "chain-name",
      po::value<std::string>(&config.chain_name)->default_value("steward-local"),
      "Chain name; the chain id is its BLAKE3 hash")(
      "strict-crypto",
      po::value<bool>(&strict_crypto)->default_value(true),
      "Verify Ed25519 signatures")(
      "log-file", po::value<std::string>(&log_file)->default_value("steward.log"),
      "Log file path")("verbose,v", "Enable verbose output")(
      "execution-delay",
      po::value<int64_t>(&config.execution_delay)->default_value(172'800),
      "Seconds between Passed and Executed")(
      "circuit-breaker-delay",
      po::value<int64_t>(&config.circuit_breaker_delay)->default_value(86'400),
      "Seconds between breaker request and activation")(
      "min-voting-period",
      po::value<int64_t>(&config.min_voting_period)->default_value(3'600),
      "Shortest voting window in seconds")(
      "max-voting-period",
      po::value<int64_t>(&config.max_voting_period)->default_value(604'800),
      "Longest voting window in seconds")(
      "oracle-min-interval",
      po::value<int64_t>(&config.oracle_min_interval)->default_value(300),
      "Minimum seconds between oracle updates")(
      "oracle-slot-buffer",
      po::value<uint64_t>(&config.oracle_min_slot_buffer)->default_value(100),
      "Minimum slots between oracle updates")(
      "oracle-stale-after",
      po::value<int64_t>(&config.oracle_stale_after)->default_value(900),
      "Seconds after which the oracle reading is reported stale")(
      "oracle-max-index",
      po::value<uint64_t>(&config.oracle_bounds.max_index_value)
          ->default_value(1'000'000'000'000),
      "Upper bound on the oracle index value")(
      "oracle-max-yield-bps",
      po::value<uint32_t>(&config.oracle_bounds.max_yield_bps)
          ->default_value(10'000),
      "Upper bound on the oracle average yield")(
      "oracle-max-volatility-bps",
      po::value<uint32_t>(&config.oracle_bounds.max_volatility_bps)
          ->default_value(10'000),
      "Upper bound on the oracle volatility")(
      "oracle-max-tvl",
      po::value<uint64_t>(&config.oracle_bounds.max_tvl_usd)
          ->default_value(1'000'000'000'000'000),
      "Upper bound on the oracle TVL in USD");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto input = std::ifstream{path};
      if (!input.good()) {
        std::cerr << "Cannot open config file '" << path << "'" << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(input, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  config.require_strict_crypto = strict_crypto;
  if (auto reason = steward::execution::validate_config(config)) {
    std::cerr << "Invalid configuration: " << *reason << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "steward", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto encoder = steward::execution::encoder_t{};
  auto storage = steward::storage::make_storage<
      steward::storage::rocksdb_storage_tag>(db_path);
  auto engine = steward::execution::engine{encoder, storage, config};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = steward::substrate::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);
  spdlog::info("gRPC service listening on {}", grpc_address);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
