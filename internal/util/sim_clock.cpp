#include "sim_clock.hpp"

namespace usedgear::util {

std::uint64_t SimClock::AdvanceTo(SimHour hour) {
  if (hour <= hour_) return 0;
  const auto elapsed = hour - hour_;
  hour_              = hour;
  return elapsed;
}

void SimClock::Restore(SimHour hour, std::uint32_t period) {
  hour_   = hour;
  period_ = period;
}

std::uint32_t HoursUntil(SimHour now, SimHour deadline) {
  if (deadline <= now) return 0;
  return static_cast<std::uint32_t>(deadline - now);
}

} // namespace usedgear::util
