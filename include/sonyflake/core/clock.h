#pragma once

#include "sonyflake/core/time.h"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace sonyflake::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests drive time by hand.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current wall-clock instant.
  virtual Timestamp now() = 0;

  // Block the caller for (at least) the given duration, as measured by this clock.
  virtual void sleep_for(std::chrono::nanoseconds duration) = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time and sleeps the calling thread.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  Timestamp now() override;
  void sleep_for(std::chrono::nanoseconds duration) override;
};

// Manual clock: time moves only through set(), advance() or sleep_for().
// sleep_for() returns immediately after advancing the clock by the requested duration.
// Thread-safe.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(Timestamp start) : nanos_(to_nanos(start)) {}
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomic)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  Timestamp now() override;
  void sleep_for(std::chrono::nanoseconds duration) override;

  void set(Timestamp ts);
  void advance(std::chrono::nanoseconds duration);

 private:
  static std::int64_t to_nanos(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(ts.time_since_epoch()).count();
  }

  std::atomic<std::int64_t> nanos_;
};

}  // namespace sonyflake::core
