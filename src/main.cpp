#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <resonance/bridge/client.hpp>
#include <resonance/common/critical.hpp>
#include <resonance/control/server.hpp>
#include <resonance/crypto/key_material.hpp>
#include <resonance/reconciler/context.hpp>
#include <atomic>
#include <csignal>
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
  auto data_dir = std::string{};
  auto key_file = std::string{};
  auto bridge_endpoint = std::string{};
  auto control_listen = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};
  auto poll_interval_ms = uint64_t{};
  auto commit_interval_ms = uint64_t{};
  auto batch_limit = uint32_t{};
  auto rpc_timeout_ms = uint64_t{};
  auto retry_max_attempts = uint32_t{};
  auto retry_initial_ms = uint64_t{};
  auto retry_max_ms = uint64_t{};
  auto breaker_threshold = uint32_t{};
  auto breaker_cooldown_ms = uint64_t{};
  auto start_cursor = uint64_t{};
  auto total_supply = std::string{};
  auto burn_target = std::string{};

  namespace po = boost::program_options;
  auto vm = po::variables_map{};
  auto description = po::options_description{"Resonance ledger reconciler"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI style file with any of the options below")(
      "data-dir,d",
      po::value<std::string>(&data_dir)->default_value("resonance_data"),
      "Directory for encrypted records and reconciler state")(
      "key-file,k", po::value<std::string>(&key_file),
      "Key material file (see resonance_keygen)")(
      "bridge-endpoint,b",
      po::value<std::string>(&bridge_endpoint)
          ->default_value("127.0.0.1:50061"),
      "IP:Port of the chain bridge")(
      "control-listen,l",
      po::value<std::string>(&control_listen)->default_value("0.0.0.0:50062"),
      "IP:Port for the control service")(
      "poll-interval-ms",
      po::value<uint64_t>(&poll_interval_ms)->default_value(10000),
      "Delay between polling cycles")(
      "commit-interval-ms",
      po::value<uint64_t>(&commit_interval_ms)->default_value(60000),
      "Delay between Merkle commitments")(
      "batch-limit", po::value<uint32_t>(&batch_limit)->default_value(500),
      "Maximum confirmations requested per cycle")(
      "rpc-timeout-ms",
      po::value<uint64_t>(&rpc_timeout_ms)->default_value(5000),
      "Deadline for every bridge call")(
      "retry-max-attempts",
      po::value<uint32_t>(&retry_max_attempts)->default_value(5),
      "Attempts per anchor submission")(
      "retry-initial-ms",
      po::value<uint64_t>(&retry_initial_ms)->default_value(200),
      "First retry delay")(
      "retry-max-ms", po::value<uint64_t>(&retry_max_ms)->default_value(10000),
      "Retry delay cap")(
      "breaker-threshold",
      po::value<uint32_t>(&breaker_threshold)->default_value(5),
      "Consecutive failures that open a circuit breaker")(
      "breaker-cooldown-ms",
      po::value<uint64_t>(&breaker_cooldown_ms)->default_value(30000),
      "Time an open circuit breaker waits before a trial call")(
      "start-cursor", po::value<uint64_t>(&start_cursor)->default_value(0),
      "Cursor to poll from when none is persisted")(
      "total-supply",
      po::value<std::string>(&total_supply)->default_value("1021000000"),
      "Total supply for burn evaluation")(
      "burn-target",
      po::value<std::string>(&burn_target)->default_value("1000000000"),
      "Amount burned once the total supply is reached")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("resonance.log"),
      "Log file")("verbose,v", "Enable verbose output");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config_path = vm["config"].as<std::string>();
      auto config = std::ifstream{config_path};
      if (!config) {
        std::cerr << "Cannot open config file " << config_path << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "resonance", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  if (key_file.empty()) {
    resonance::common::critical("--key-file is required");
  }
  auto error = std::string{};
  auto keys = resonance::crypto::key_material::load(key_file, error);
  if (!keys) {
    resonance::common::critical(
        "Refusing to start without key material: {}", error);
  }

  auto options = resonance::reconciler::context_options_t{};
  options.data_dir = data_dir;
  options.watcher.poll_interval = std::chrono::milliseconds{poll_interval_ms};
  options.watcher.commit_interval =
      std::chrono::milliseconds{commit_interval_ms};
  options.watcher.batch_limit = batch_limit;
  options.watcher.start_cursor = start_cursor;
  options.watcher.retry.max_attempts = retry_max_attempts;
  options.watcher.retry.initial_delay =
      std::chrono::milliseconds{retry_initial_ms};
  options.watcher.retry.max_delay = std::chrono::milliseconds{retry_max_ms};
  options.watcher.breaker_threshold = breaker_threshold;
  options.watcher.breaker_cooldown =
      std::chrono::milliseconds{breaker_cooldown_ms};
  options.anchor.retry = options.watcher.retry;
  options.anchor.breaker_threshold = breaker_threshold;
  options.anchor.breaker_cooldown = options.watcher.breaker_cooldown;

  auto parsed_total = resonance::schema::try_parse_amount(total_supply);
  auto parsed_target = resonance::schema::try_parse_amount(burn_target);
  if (!parsed_total || !parsed_target) {
    resonance::common::critical(
        "--total-supply and --burn-target must be unsigned decimals");
  }
  options.supply.total_supply = *parsed_total;
  options.supply.burn_target = *parsed_target;

  auto bridge = resonance::bridge::client::connect(
      bridge_endpoint, std::chrono::milliseconds{rpc_timeout_ms});
  auto context = resonance::reconciler::context{
      std::move(options), std::move(*keys), bridge.event_fetcher(),
      bridge.root_submitter(), bridge.latest_root_reader(),
      bridge.transfer_submitter()};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = resonance::control::listener{context};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(control_listen,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    resonance::common::critical("Failed to start the control service on {}",
                                control_listen);
  }
  spdlog::info("Control service listening on {}", control_listen);
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  context.start();

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    context.stop();
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
