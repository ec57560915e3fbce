#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sovereign/config/feature_flags.hpp>
#include <sovereign/config/options.hpp>
#include <sovereign/http/curl_transport.hpp>
#include <sovereign/identity/issuer.hpp>
#include <sovereign/rpc/server.hpp>
#include <sovereign/server/attestor.hpp>
#include <sovereign/session/manager.hpp>
#include <sovereign/storage/rocksdb/storage.hpp>
#include <sovereign/verifier/client.hpp>
#include <atomic>
#include <iostream>
#include <optional>
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

  auto parsed = sovereign::config::parse(argc, argv);
  if (!parsed.ok()) {
    std::cerr << parsed.log << std::endl;
    return 1;
  }
  auto options = std::move(*parsed.value);
  if (options.help) {
    std::cout << sovereign::config::make_description() << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "sovereignd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);

  auto flags = sovereign::config::feature_flags{};
  if (auto loaded = flags.load(options.feature_flags); !loaded.ok()) {
    spdlog::error("{}", loaded.log);
    spdlog::shutdown();
    return 1;
  }

  auto journal = std::optional<sovereign::session::journal_t>{};
  if (!options.session_db.empty()) {
    journal.emplace(sovereign::storage::make_storage<
                    sovereign::storage::rocksdb_storage_tag>(options.session_db));
  }
  auto sessions = sovereign::session::manager{
      options.session_ttl, sovereign::session::system_now,
      journal ? &*journal : nullptr};

  auto transport = sovereign::http::curl_transport{
      sovereign::http::curl_options{.timeout = options.verifier_timeout}};
  auto verifier =
      sovereign::verifier::client{transport, options.verifier_url};
  auto issuer = sovereign::identity::issuer{
      sovereign::identity::issuer_options{.trust_domain = options.trust_domain,
                                          .ttl = options.credential_ttl},
      sovereign::session::system_now};
  auto attestor = sovereign::server::attestor{
      flags, sessions, verifier, issuer,
      sovereign::server::attestor_options{
          .policy = options.policy, .required_rings = options.required_rings}};

  spdlog::info("Verifier at {}, trust domain {}", options.verifier_url,
               options.trust_domain);
  spdlog::info("gRPC service listening on {}", options.grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = sovereign::rpc::listener{attestor};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to listen on {}", options.grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    auto ticks = 0;
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
      if (++ticks % 10 == 0) {
        if (auto purged = sessions.purge_expired(); purged > 0) {
          spdlog::debug("Purged {} expired sessions", purged);
        }
      }
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
