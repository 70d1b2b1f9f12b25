// Repository: Stagegate
// Component: Daemon Configuration
// Purpose: Command-line options for stagegated, parsed into one value.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_RUNTIME_DAEMON_CONFIG_HPP_
#define STAGEGATE_RUNTIME_DAEMON_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "stagegate/rules/RuleConfig.hpp"
#include "stagegate/runtime/RecurringCommandScheduler.hpp"
#include "stagegate/store/ResilientStore.hpp"

namespace stagegate::runtime {

enum class StorageBackend {
  kJsonl,
  kSqlite,
};

struct DaemonConfig {
  std::string listen_address = "0.0.0.0:50061";
  std::string data_dir = "./stagegate-data";

  StorageBackend backend = StorageBackend::kJsonl;
  std::string sqlite_path;  // Empty: <data_dir>/stagegate.db
  std::string table_prefix = "stagegate_";

  rules::RuleConfig rules;
  int64_t prune_interval_seconds = 300;

  store::RetryPolicy retry;
  bool use_retry = true;

  size_t storage_workers = 1;
  size_t history_limit = 50;

  std::vector<ScheduleEntry> schedules;

  bool help = false;
  bool valid = false;
  std::string error;

  std::string ResolvedSqlitePath() const {
    return sqlite_path.empty() ? data_dir + "/stagegate.db" : sqlite_path;
  }
};

DaemonConfig ParseDaemonArgs(int argc, const char* const argv[]);
void PrintUsage(const char* program_name, std::ostream& out);

// One-line key=value summary for the startup log.
std::string DescribeConfig(const DaemonConfig& config);

}  // namespace stagegate::runtime

#endif  // STAGEGATE_RUNTIME_DAEMON_CONFIG_HPP_
