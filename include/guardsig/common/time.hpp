#pragma once

#include <chrono>
#include <cstdint>

namespace guardsig {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Encoded timestamps are always milliseconds since the Unix epoch.
inline int64_t ToEpochMillis(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline TimePoint FromEpochMillis(int64_t millis) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

// Signed difference `later - earlier` in fractional days.
inline double DaysBetween(TimePoint earlier, TimePoint later) {
  const auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(later - earlier);
  return static_cast<double>(diff.count()) / (86400.0 * 1000.0);
}

}  // namespace guardsig
