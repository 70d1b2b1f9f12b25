// Repository: Stagegate
// Component: stagegated entry point
// Purpose: Wires backends, retry layer, engine, schedules and the gRPC
//          StagingControl service; runs until SIGINT/SIGTERM.
// Copyright (c) 2026 Stagegate

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "service/staging_service.h"
#include "stagegate/events/EventBus.hpp"
#include "stagegate/execution/HostDispatchChannel.hpp"
#include "stagegate/rules/RuleEvaluator.hpp"
#include "stagegate/runtime/DaemonConfig.hpp"
#include "stagegate/runtime/PeriodicTask.hpp"
#include "stagegate/runtime/RecurringCommandScheduler.hpp"
#include "stagegate/runtime/StorageExecutor.hpp"
#include "stagegate/staging/HistoryRecorder.hpp"
#include "stagegate/staging/LifecycleEngine.hpp"
#include "stagegate/store/JsonlFile.hpp"
#include "stagegate/store/JsonlHistoryStore.hpp"
#include "stagegate/store/JsonlStagedRequestStore.hpp"
#include "stagegate/store/ResilientStore.hpp"
#include "stagegate/store/SqliteHistoryStore.hpp"
#include "stagegate/store/SqliteStagedRequestStore.hpp"
#include "stagegate/telemetry/StagingMetrics.hpp"
#include "stagegate/time/IWaitStrategy.hpp"
#include "stagegate/time/SystemTimeSource.hpp"
#include "stagegate/util/Logger.hpp"

namespace {

using stagegate::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct Backends {
  std::shared_ptr<stagegate::store::IStagedRequestStore> pending;
  std::shared_ptr<stagegate::store::IHistoryStore> history;
};

// Throws StorageError when a backend cannot be opened.
Backends OpenBackends(const stagegate::runtime::DaemonConfig& config) {
  using namespace stagegate::store;
  Backends b;
  if (config.backend == stagegate::runtime::StorageBackend::kSqlite) {
    const std::string path = config.ResolvedSqlitePath();
    const size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0) EnsureDirectory(path.substr(0, slash));
    b.pending = std::make_shared<SqliteStagedRequestStore>(path, config.table_prefix);
    b.history = std::make_shared<SqliteHistoryStore>(path, config.table_prefix);
  } else {
    b.pending = std::make_shared<JsonlStagedRequestStore>(config.data_dir);
    b.history = std::make_shared<JsonlHistoryStore>(config.data_dir);
  }
  return b;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace stagegate;

  runtime::DaemonConfig config = runtime::ParseDaemonArgs(argc, argv);
  if (config.help) {
    runtime::PrintUsage(argv[0], std::cout);
    return 0;
  }
  if (!config.valid) {
    std::cerr << "Error: " << config.error << "\n\n";
    runtime::PrintUsage(argv[0], std::cerr);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  Logger::Info("[stagegated] CONFIG " + runtime::DescribeConfig(config));

  auto time_source = std::make_shared<time::SystemTimeSource>();
  auto waiter = std::make_shared<time::RealtimeWaitStrategy>();
  auto executor = std::make_shared<runtime::StorageExecutor>(config.storage_workers);

  Backends backends;
  try {
    backends = OpenBackends(config);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[stagegated] STORAGE_INIT_FAILED error=") + e.what());
    return 1;
  }

  std::shared_ptr<store::ResilientStore> resilient;
  std::shared_ptr<store::IStagedRequestStore> pending_store = backends.pending;
  if (config.use_retry) {
    resilient = std::make_shared<store::ResilientStore>(backends.pending, config.retry, time_source, waiter);
    pending_store = resilient;
  }

  // Wiring: listeners and the dispatcher exist before the engine.
  auto channel = std::make_shared<execution::HostDispatchChannel>();
  auto event_bus = std::make_shared<events::EventBus>();
  auto metrics = std::make_shared<telemetry::StagingMetrics>();
  event_bus->Subscribe(metrics);

  auto history = std::make_shared<staging::HistoryRecorder>(backends.history, executor,
                                                            config.history_limit);
  auto engine = std::make_shared<staging::LifecycleEngine>(
      rules::RuleEvaluator(config.rules), pending_store, history, channel, event_bus, executor, time_source);

  history->LoadAsync();
  engine->LoadOnStartup();

  runtime::PeriodicTask prune("prune", std::chrono::seconds(config.prune_interval_seconds),
                              [engine] { engine->PruneExpired(); });
  prune.Start();

  runtime::RecurringCommandScheduler scheduler(engine, channel);
  for (const auto& entry : config.schedules) scheduler.Add(entry);
  scheduler.StartAll();

  auto control = std::make_shared<service::StagingControlImpl>(engine, resilient, metrics, channel);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(control.get());
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[stagegated] LISTEN_FAILED address=" + config.listen_address);
    scheduler.StopAll();
    prune.Stop();
    executor->WaitIdle();
    return 1;
  }
  Logger::Info("[stagegated] LISTENING address=" + config.listen_address);

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  Logger::Info("[stagegated] SHUTDOWN requested");
  scheduler.StopAll();
  prune.Stop();
  control->RequestShutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  executor->WaitIdle();

  std::ostringstream oss;
  oss << "[stagegated] STOPPED pending=" << engine->PendingCount()
      << " expired_total=" << engine->ExpiredTotal()
      << " failed_storage_tasks=" << executor->FailedTasks();
  Logger::Info(oss.str());
  return 0;
}
