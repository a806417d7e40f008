#pragma once

#include <cstdint>

namespace usedgear::util {

/*
  Simulated time - single place that owns the engine's notion of "now".

  The host delivers a monotonic hour counter; nothing in the engine reads
  wall-clock time, so persisted timestamps stay valid across loads.
*/

using SimHour = std::uint64_t;

inline constexpr std::uint32_t kHoursPerPeriod = 24;

class SimClock {
 public:
  SimHour Now() const {
    return hour_;
  }

  std::uint32_t Period() const {
    return period_;
  }

  // Moves the clock to `hour` and returns the elapsed hours. Returns 0 and
  // leaves the clock alone when `hour` is not ahead of Now().
  std::uint64_t AdvanceTo(SimHour hour);

  void SetPeriod(std::uint32_t period) {
    period_ = period;
  }

  // Restores persisted time without treating it as elapsed.
  void Restore(SimHour hour, std::uint32_t period);

 private:
  SimHour       hour_   = 0;
  std::uint32_t period_ = 0;
};

// Hours left until `deadline`, zero once it has passed.
std::uint32_t HoursUntil(SimHour now, SimHour deadline);

} // namespace usedgear::util
