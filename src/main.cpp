#include <curl/curl.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <portage/abci/server.hpp>
#include <portage/bridge/json_rpc_reader.hpp>
#include <portage/config/options.hpp>
#include <portage/execution/engine.hpp>
#include <portage/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
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
  auto parsed = portage::config::parse_node_options(argc, argv);
  if (parsed.status == portage::config::parse_status::help) {
    std::cout << parsed.message << std::endl;
    return 0;
  }
  if (parsed.status == portage::config::parse_status::error) {
    std::cerr << "portage: " << parsed.message << std::endl;
    return 1;
  }
  auto& options = parsed.options;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);

  if (!options.strict_crypto) {
    spdlog::warn("Signature verification disabled; local networks only");
  }

  auto encoder = portage::schema::encoding::scale_encoder_t{};
  auto storage = portage::storage::make_storage<
      portage::storage::rocksdb_storage_tag>(options.db_path);
  auto engine = portage::execution::engine{encoder, storage, options.bridge,
                                           options.strict_crypto};

  if (options.bridge_enabled) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    engine.set_chain_reader(
        std::make_shared<portage::bridge::json_rpc_reader>(
            options.rpc_url, options.bridge.contract, options.rpc_timeout_ms,
            options.rpc_connect_timeout_ms));
    spdlog::info("Bridge reading deposits from {} (contract {})",
                 options.rpc_url, options.bridge.contract);
  }
  if (options.bridge.signer_key) {
    spdlog::info("Withdrawal auto-signing enabled");
  }

  spdlog::info("gRPC service listening on {}", options.grpc_port);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = portage::abci::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_port,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", options.grpc_port);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  if (options.bridge_enabled) {
    curl_global_cleanup();
  }
  spdlog::shutdown();
  return 0;
}
