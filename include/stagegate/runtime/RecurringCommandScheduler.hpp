// Repository: Stagegate
// Component: Recurring Command Scheduler
// Purpose: Named commands fired every N seconds, either staged for review as
//          the console principal or dispatched directly.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_RUNTIME_RECURRING_COMMAND_SCHEDULER_HPP_
#define STAGEGATE_RUNTIME_RECURRING_COMMAND_SCHEDULER_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "stagegate/execution/ICommandDispatcher.hpp"
#include "stagegate/runtime/PeriodicTask.hpp"
#include "stagegate/staging/LifecycleEngine.hpp"

namespace stagegate::runtime {

struct ScheduleEntry {
  std::string name;
  std::string command_text;
  // true: Stage() as console (auto-approval allowed). false: dispatch directly.
  bool require_approval = false;
  int64_t interval_seconds = 0;
};

// Parses "name=SECONDS:approve|direct:/command args". Returns false and sets
// *error on malformed input.
bool ParseScheduleSpec(const std::string& spec, ScheduleEntry* out, std::string* error);

class RecurringCommandScheduler {
 public:
  RecurringCommandScheduler(std::shared_ptr<staging::LifecycleEngine> engine,
                            std::shared_ptr<execution::ICommandDispatcher> dispatcher);
  ~RecurringCommandScheduler();

  RecurringCommandScheduler(const RecurringCommandScheduler&) = delete;
  RecurringCommandScheduler& operator=(const RecurringCommandScheduler&) = delete;

  // Entries with interval_seconds <= 0 are skipped with a warning. Returns
  // false for such an entry or a duplicate name.
  bool Add(const ScheduleEntry& entry);

  void StartAll();
  void StopAll();

  // Fires one schedule immediately on the calling thread. False if unknown.
  bool Fire(const std::string& name);

  size_t Size() const { return schedules_.size(); }

 private:
  struct Schedule {
    ScheduleEntry entry;
    std::unique_ptr<PeriodicTask> task;
  };

  void Run(const ScheduleEntry& entry);

  std::shared_ptr<staging::LifecycleEngine> engine_;
  std::shared_ptr<execution::ICommandDispatcher> dispatcher_;
  std::vector<Schedule> schedules_;
};

}  // namespace stagegate::runtime

#endif  // STAGEGATE_RUNTIME_RECURRING_COMMAND_SCHEDULER_HPP_
