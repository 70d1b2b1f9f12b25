#pragma once
#include "stagegate/time/ITimeSource.hpp"
#include <chrono>
#include <ctime>

namespace stagegate::time {

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }

  int64_t LocalTimeOfDayMs() const override {
    const int64_t now_ms = NowUtcMs();
    time_t s = static_cast<time_t>(now_ms / 1000);
    struct tm tm;
    if (localtime_r(&s, &tm) == nullptr) return 0;
    return (static_cast<int64_t>(tm.tm_hour) * 3600 + tm.tm_min * 60 + tm.tm_sec) * 1000 +
           now_ms % 1000;
  }
};

}  // namespace stagegate::time
