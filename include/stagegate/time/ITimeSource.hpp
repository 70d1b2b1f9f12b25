#pragma once
#include <cstdint>

namespace stagegate::time {

inline constexpr int64_t kMsPerDay = 24LL * 60 * 60 * 1000;

class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
  // Milliseconds since local midnight, in [0, kMsPerDay).
  virtual int64_t LocalTimeOfDayMs() const = 0;
};

}  // namespace stagegate::time
