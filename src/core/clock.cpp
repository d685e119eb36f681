#include "sonyflake/core/clock.h"

#include <thread>

namespace sonyflake::core {

Timestamp SystemClock::now() {
  return Clock::now();
}

void SystemClock::sleep_for(const std::chrono::nanoseconds duration) {
  std::this_thread::sleep_for(duration);
}

Timestamp ManualClock::now() {
  const std::chrono::nanoseconds since_epoch{nanos_.load(std::memory_order_acquire)};
  return Timestamp{std::chrono::duration_cast<Clock::duration>(since_epoch)};
}

void ManualClock::sleep_for(const std::chrono::nanoseconds duration) {
  advance(duration);
}

void ManualClock::set(const Timestamp ts) {
  nanos_.store(to_nanos(ts), std::memory_order_release);
}

void ManualClock::advance(const std::chrono::nanoseconds duration) {
  nanos_.fetch_add(duration.count(), std::memory_order_acq_rel);
}

}  // namespace sonyflake::core
