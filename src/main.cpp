#include <auditchain/config/config.hpp>
#include <auditchain/rpc/server.hpp>
#include <auditchain/service/audit_trail.hpp>
#include <auditchain/storage/rocksdb/storage.hpp>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
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
  auto parsed = auditchain::config::parse_arguments(argc, argv);
  switch (parsed.outcome) {
    case auditchain::config::parse_outcome::help:
      std::cout << parsed.message << std::endl;
      return 0;
    case auditchain::config::parse_outcome::error:
      std::cerr << "auditchain: " << parsed.message << std::endl;
      return 2;
    case auditchain::config::parse_outcome::run:
      break;
  }
  const auto& config = parsed.config;

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "auditchain", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(*auditchain::config::try_parse_log_level(config.log_level));

  auto encoder = auditchain::ledger::encoder_t{};
  auto storage =
      auditchain::storage::make_storage<auditchain::storage::rocksdb_storage_tag>(
          config.db_path,
          auditchain::storage::storage_options{.sync_writes =
                                                   config.sync_writes});
  auto trail = auditchain::service::audit_trail{
      encoder, storage,
      auditchain::service::audit_trail_options{
          .append_timeout =
              std::chrono::milliseconds{config.append_timeout_ms},
          .freeze_on_violation = config.freeze_on_violation}};

  if (config.verify_on_start) {
    auto result = trail.verify();
    if (result.is_valid) {
      spdlog::info("Startup verification #{} passed over {} entries",
                   result.id, result.entries_verified);
    } else {
      spdlog::error("Startup verification #{} failed at sequence {}: {}",
                    result.id, result.first_invalid_sequence.value_or(0),
                    result.reason);
    }
  }

  spdlog::info("gRPC service listening on {}", config.listen);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = auditchain::rpc::listener{trail};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(config.listen,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", config.listen);
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
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
