/**
 * @file raw_frame.cpp
 * @brief Arrival clock helpers for RawFrame.
 */
#include "relay/mem/raw_frame.hpp"

#include <chrono>

namespace relay::mem {

std::uint64_t wall_clock_us() noexcept {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<microseconds>(system_clock::now().time_since_epoch()).count());
}

std::uint64_t MonotonicWallClock::now_us() noexcept {
  const auto now = wall_clock_us();
  if (now > last_us_) last_us_ = now;
  return last_us_;
}

} // namespace relay::mem
