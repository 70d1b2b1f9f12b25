// Repository: Stagegate
// Component: Recurring Command Scheduler
// Copyright (c) 2026 Stagegate

#include "stagegate/runtime/RecurringCommandScheduler.hpp"

#include <cctype>
#include <sstream>

#include "stagegate/staging/CommandValidator.hpp"
#include "stagegate/util/Logger.hpp"

namespace stagegate::runtime {

bool ParseScheduleSpec(const std::string& spec, ScheduleEntry* out, std::string* error) {
  const size_t eq = spec.find('=');
  if (eq == std::string::npos || eq == 0) {
    *error = "schedule must look like name=SECONDS:approve|direct:/command";
    return false;
  }
  const size_t c1 = spec.find(':', eq + 1);
  const size_t c2 = c1 == std::string::npos ? std::string::npos : spec.find(':', c1 + 1);
  if (c1 == std::string::npos || c2 == std::string::npos) {
    *error = "schedule must look like name=SECONDS:approve|direct:/command";
    return false;
  }

  const std::string seconds = spec.substr(eq + 1, c1 - eq - 1);
  if (seconds.empty() || seconds.size() > 9) {
    *error = "schedule interval must be a positive number of seconds";
    return false;
  }
  for (char c : seconds) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      *error = "schedule interval must be a positive number of seconds";
      return false;
    }
  }

  const std::string mode = spec.substr(c1 + 1, c2 - c1 - 1);
  if (mode != "approve" && mode != "direct") {
    *error = "schedule mode must be 'approve' or 'direct'";
    return false;
  }

  ScheduleEntry entry;
  entry.name = spec.substr(0, eq);
  entry.interval_seconds = std::stoll(seconds);
  entry.require_approval = mode == "approve";
  entry.command_text = spec.substr(c2 + 1);
  if (entry.interval_seconds <= 0) {
    *error = "schedule interval must be a positive number of seconds";
    return false;
  }
  if (staging::ValidateCommand(entry.command_text) != staging::ValidationResult::kValid) {
    *error = "schedule command must start with '/' followed by an operation";
    return false;
  }
  *out = std::move(entry);
  return true;
}

RecurringCommandScheduler::RecurringCommandScheduler(
    std::shared_ptr<staging::LifecycleEngine> engine,
    std::shared_ptr<execution::ICommandDispatcher> dispatcher)
    : engine_(std::move(engine)), dispatcher_(std::move(dispatcher)) {}

RecurringCommandScheduler::~RecurringCommandScheduler() {
  StopAll();
}

bool RecurringCommandScheduler::Add(const ScheduleEntry& entry) {
  if (entry.interval_seconds <= 0) {
    util::Logger::Warn("[Scheduler] SKIP name=" + entry.name + " reason=non_positive_interval");
    return false;
  }
  for (const auto& s : schedules_) {
    if (s.entry.name == entry.name) {
      util::Logger::Warn("[Scheduler] SKIP name=" + entry.name + " reason=duplicate_name");
      return false;
    }
  }
  Schedule schedule;
  schedule.entry = entry;
  schedule.task = std::make_unique<PeriodicTask>(
      "schedule." + entry.name, std::chrono::seconds(entry.interval_seconds),
      [this, entry] { Run(entry); });
  schedules_.push_back(std::move(schedule));
  return true;
}

void RecurringCommandScheduler::StartAll() {
  for (auto& s : schedules_) s.task->Start();
}

void RecurringCommandScheduler::StopAll() {
  for (auto& s : schedules_) s.task->Stop();
}

bool RecurringCommandScheduler::Fire(const std::string& name) {
  for (auto& s : schedules_) {
    if (s.entry.name == name) {
      s.task->RunOnce();
      return true;
    }
  }
  return false;
}

void RecurringCommandScheduler::Run(const ScheduleEntry& entry) {
  const staging::Principal console = staging::ConsolePrincipal();
  if (entry.require_approval) {
    const staging::StageResult result = engine_->Stage(console, entry.command_text);
    std::ostringstream oss;
    oss << "[Scheduler] FIRED name=" << entry.name
        << " outcome=" << staging::StageOutcomeName(result.outcome);
    util::Logger::Info(oss.str());
    return;
  }
  dispatcher_->Dispatch(console, staging::StripOperationMarker(entry.command_text));
  std::ostringstream oss;
  oss << "[Scheduler] FIRED name=" << entry.name << " outcome=DISPATCHED";
  util::Logger::Info(oss.str());
}

}  // namespace stagegate::runtime
