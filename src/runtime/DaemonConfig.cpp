// Repository: Stagegate
// Component: Daemon Configuration
// Copyright (c) 2026 Stagegate

#include "stagegate/runtime/DaemonConfig.hpp"

#include <sstream>
#include <stdexcept>

namespace stagegate::runtime {

namespace {

// Parses a non-negative integer flag value; sets config.error on failure.
bool ParseCount(const std::string& flag, const std::string& text, int64_t* out,
                DaemonConfig& config) {
  try {
    size_t used = 0;
    const long long v = std::stoll(text, &used);
    if (used != text.size() || v < 0) throw std::invalid_argument(text);
    *out = static_cast<int64_t>(v);
    return true;
  } catch (const std::exception&) {
    config.error = flag + " expects a non-negative integer, got '" + text + "'";
    return false;
  }
}

}  // namespace

void PrintUsage(const char* program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [OPTIONS]\n"
      << "\n"
      << "Command staging daemon: intercepted commands wait for review, are\n"
      << "auto-approved inside a time window, or expire.\n"
      << "\n"
      << "SERVER:\n"
      << "  --listen ADDR                 gRPC listen address (default 0.0.0.0:50061)\n"
      << "\n"
      << "STORAGE:\n"
      << "  --data-dir DIR                Data directory (default ./stagegate-data)\n"
      << "  --backend jsonl|sqlite        Durable backend (default jsonl)\n"
      << "  --sqlite-path PATH            SQLite file (default <data-dir>/stagegate.db)\n"
      << "  --table-prefix PREFIX         SQLite table prefix (default stagegate_)\n"
      << "  --storage-workers N           Storage worker threads (default 1)\n"
      << "  --history-limit N             History entries kept per requester (default 50)\n"
      << "\n"
      << "RETRY / CIRCUIT BREAKER:\n"
      << "  --max-retries N               Retries after the first attempt (default 3)\n"
      << "  --base-delay-ms N             Backoff base (default 100)\n"
      << "  --max-delay-ms N              Backoff cap (default 5000)\n"
      << "  --failure-threshold N         Failures before the circuit opens (default 5)\n"
      << "  --cooldown-ms N               Open -> half-open delay (default 30000)\n"
      << "  --no-circuit-breaker          Retry, but never open the circuit\n"
      << "  --no-retry                    Use the backend directly\n"
      << "\n"
      << "RULES:\n"
      << "  --auto-approve-window HH:MM-HH:MM   Enable auto-approval inside the window\n"
      << "  --expiration-minutes N        Pending lifetime; 0 disables (default 1440)\n"
      << "  --prune-interval-seconds N    Expiration sweep period (default 300)\n"
      << "\n"
      << "SCHEDULES:\n"
      << "  --schedule name=SECONDS:approve|direct:/command   (repeatable)\n"
      << "\n"
      << "  -h, --help                    Show this help\n";
}

DaemonConfig ParseDaemonArgs(int argc, const char* const argv[]) {
  DaemonConfig config;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    int64_t n = 0;

    if (arg == "--help" || arg == "-h") {
      config.help = true;
      config.valid = true;
      return config;
    } else if (arg == "--listen" && has_value) {
      config.listen_address = argv[++i];
    } else if (arg == "--data-dir" && has_value) {
      config.data_dir = argv[++i];
    } else if (arg == "--backend" && has_value) {
      const std::string v = argv[++i];
      if (v == "jsonl") {
        config.backend = StorageBackend::kJsonl;
      } else if (v == "sqlite") {
        config.backend = StorageBackend::kSqlite;
      } else {
        config.error = "--backend must be 'jsonl' or 'sqlite', got '" + v + "'";
        return config;
      }
    } else if (arg == "--sqlite-path" && has_value) {
      config.sqlite_path = argv[++i];
    } else if (arg == "--table-prefix" && has_value) {
      config.table_prefix = argv[++i];
    } else if (arg == "--storage-workers" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      if (n == 0) {
        config.error = "--storage-workers must be at least 1";
        return config;
      }
      config.storage_workers = static_cast<size_t>(n);
    } else if (arg == "--history-limit" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      if (n == 0) {
        config.error = "--history-limit must be at least 1";
        return config;
      }
      config.history_limit = static_cast<size_t>(n);
    } else if (arg == "--max-retries" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      config.retry.max_retries = static_cast<int>(n);
    } else if (arg == "--base-delay-ms" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      config.retry.base_delay_ms = n;
    } else if (arg == "--max-delay-ms" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      config.retry.max_delay_ms = n;
    } else if (arg == "--failure-threshold" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      if (n == 0) {
        config.error = "--failure-threshold must be at least 1";
        return config;
      }
      config.retry.failure_threshold = static_cast<int>(n);
    } else if (arg == "--cooldown-ms" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      config.retry.cooldown_ms = n;
    } else if (arg == "--no-circuit-breaker") {
      config.retry.circuit_breaker_enabled = false;
    } else if (arg == "--no-retry") {
      config.use_retry = false;
    } else if (arg == "--auto-approve-window" && has_value) {
      const std::string window = argv[++i];
      const size_t dash = window.find('-');
      const std::string start = dash == std::string::npos ? window : window.substr(0, dash);
      const std::string end = dash == std::string::npos ? "" : window.substr(dash + 1);
      // Malformed times disable auto-approval with a warning; not fatal.
      rules::ApplyAutoApproveWindow(config.rules, true, start, end);
    } else if (arg == "--expiration-minutes" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      config.rules.expiration_enabled = n > 0;
      if (n > 0) config.rules.expiration_ms = n * 60 * 1000;
    } else if (arg == "--prune-interval-seconds" && has_value) {
      if (!ParseCount(arg, argv[++i], &n, config)) return config;
      if (n == 0) {
        config.error = "--prune-interval-seconds must be at least 1";
        return config;
      }
      config.prune_interval_seconds = n;
    } else if (arg == "--schedule" && has_value) {
      ScheduleEntry entry;
      std::string error;
      if (!ParseScheduleSpec(argv[++i], &entry, &error)) {
        config.error = "--schedule: " + error;
        return config;
      }
      config.schedules.push_back(std::move(entry));
    } else {
      config.error = "Unknown argument: " + arg;
      return config;
    }
  }

  if (config.retry.max_delay_ms < config.retry.base_delay_ms) {
    config.error = "--max-delay-ms must not be below --base-delay-ms";
    return config;
  }

  config.valid = true;
  return config;
}

std::string DescribeConfig(const DaemonConfig& c) {
  std::ostringstream o;
  o << "listen=" << c.listen_address
    << " backend=" << (c.backend == StorageBackend::kSqlite ? "sqlite" : "jsonl")
    << " data_dir=" << c.data_dir;
  if (c.backend == StorageBackend::kSqlite)
    o << " sqlite_path=" << c.ResolvedSqlitePath() << " table_prefix=" << c.table_prefix;
  o << " retry=" << (c.use_retry ? "on" : "off")
    << " max_retries=" << c.retry.max_retries
    << " base_delay_ms=" << c.retry.base_delay_ms
    << " max_delay_ms=" << c.retry.max_delay_ms
    << " circuit_breaker=" << (c.retry.circuit_breaker_enabled ? "on" : "off")
    << " failure_threshold=" << c.retry.failure_threshold
    << " cooldown_ms=" << c.retry.cooldown_ms
    << " auto_approve=" << (c.rules.auto_approve_enabled ? "on" : "off");
  if (c.rules.auto_approve_enabled)
    o << " window=" << rules::FormatTimeOfDay(c.rules.auto_approve_start_ms) << "-"
      << rules::FormatTimeOfDay(c.rules.auto_approve_end_ms);
  o << " expiration_ms=" << (c.rules.expiration_enabled ? c.rules.expiration_ms : 0)
    << " prune_interval_s=" << c.prune_interval_seconds
    << " storage_workers=" << c.storage_workers
    << " history_limit=" << c.history_limit
    << " schedules=" << c.schedules.size();
  return o.str();
}

}  // namespace stagegate::runtime
