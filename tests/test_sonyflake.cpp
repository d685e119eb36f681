#include "sonyflake/core/clock.h"
#include "sonyflake/core/time.h"
#include "sonyflake/generator/backoff.h"
#include "sonyflake/generator/generator_state.h"
#include "sonyflake/generator/layout.h"
#include "sonyflake/generator/sonyflake.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace sonyflake;
using namespace std::chrono_literals;

namespace {

core::Timestamp start_instant() {
  return core::parse_iso8601("2020-01-01T00:00:00Z").value();
}

generator::Sonyflake make_generator(core::Timestamp start, std::uint16_t machine_id) {
  return generator::Sonyflake(
      std::make_shared<generator::GeneratorState>(core::to_sonyflake_time(start), machine_id));
}

}  // namespace

// ── Tick advance and encoding ──────────────────────────────────────────────

TEST_CASE("next_id: first call in a later tick starts the sequence at 0", "[generator]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 7);

  const auto id = sf.next_id(start + 1s);
  REQUIRE(id.has_value());
  CHECK(id.value() == generator::compose(100, 0, 7));

  const auto parts = generator::decompose(id.value());
  CHECK(parts.time == 100);
  CHECK(parts.sequence == 0);
  CHECK(parts.machine_id == 7);
}

TEST_CASE("next_id: ticks are truncated 10ms units", "[generator]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 1);

  const auto id = sf.next_id(start + 19ms);
  REQUIRE(id.has_value());
  CHECK(generator::decompose(id.value()).time == 1);
}

TEST_CASE("next_id: same tick increments the sequence", "[generator]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 3);
  const auto now = start + 2s;

  const auto first = sf.next_id(now);
  const auto second = sf.next_id(now);
  const auto third = sf.next_id(now + 5ms);  // still tick 200
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  REQUIRE(third.has_value());

  CHECK(generator::decompose(first.value()).sequence == 0);
  CHECK(generator::decompose(second.value()).sequence == 1);
  CHECK(generator::decompose(third.value()).sequence == 2);
  CHECK(generator::decompose(third.value()).time == 200);
}

TEST_CASE("next_id: 1000 calls with a non-decreasing clock are strictly increasing",
          "[generator]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 99);
  core::ManualClock clock(start + 1h);

  std::uint64_t last = 0;
  std::set<std::uint64_t> seen;
  for (int i = 0; i < 1000; ++i) {
    const auto id = sf.next_id(clock.now());
    REQUIRE(id.has_value());
    CHECK(id.value() > last);
    last = id.value();
    seen.insert(id.value());
    clock.advance(1ms);
  }
  CHECK(seen.size() == 1000);
}

TEST_CASE("next_id: clock moving backwards stays on the last tick", "[generator]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 5);

  const auto later = sf.next_id(start + 1s);
  const auto earlier = sf.next_id(start + 500ms);
  REQUIRE(later.has_value());
  REQUIRE(earlier.has_value());

  const auto parts = generator::decompose(earlier.value());
  CHECK(parts.time == 100);
  CHECK(parts.sequence == 1);
  CHECK(earlier.value() > later.value());
}

TEST_CASE("next_id: every ID carries the configured machine id", "[generator]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 42);
  core::ManualClock clock(start + 10min);

  for (int i = 0; i < 300; ++i) {
    const auto id = sf.next_id(clock.now());
    REQUIRE(id.has_value());
    CHECK(generator::decompose(id.value()).machine_id == 42);
    clock.advance(3ms);
  }
}

// ── Sequence exhaustion ─────────────────────────────────────────────────────

TEST_CASE("next_id: a fresh generator at its start tick has 255 free slots", "[generator][sequence]") {
  // elapsed_time starts at 0 and sequence at 256, so tick 0 continues from 257.
  const auto start = start_instant();
  const auto sf = make_generator(start, 1);

  for (int i = 0; i < 255; ++i) {
    const auto id = sf.next_id(start);
    REQUIRE(id.has_value());
    CHECK(generator::decompose(id.value()).sequence == static_cast<std::uint64_t>(257 + i));
  }

  const auto exhausted = sf.next_id(start);
  REQUIRE_FALSE(exhausted.has_value());
  CHECK(exhausted.error() == core::GenerationError::kSequenceExhausted);
}

TEST_CASE("next_id: a new tick offers 512 slots before exhaustion", "[generator][sequence]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 1);
  const auto now = start + 3s;

  std::set<std::uint64_t> ids;
  for (int i = 0; i < 512; ++i) {
    const auto id = sf.next_id(now);
    REQUIRE(id.has_value());
    ids.insert(id.value());
  }
  CHECK(ids.size() == 512);

  const auto exhausted = sf.next_id(now);
  REQUIRE_FALSE(exhausted.has_value());
  CHECK(exhausted.error() == core::GenerationError::kSequenceExhausted);
}

TEST_CASE("next_id: exhaustion keeps the last issued sequence and recovers on the next tick",
          "[generator][sequence]") {
  const auto start = start_instant();
  auto state = std::make_shared<generator::GeneratorState>(core::to_sonyflake_time(start), 9);
  const generator::Sonyflake sf(state);
  const auto now = start + 1s;

  std::set<std::uint64_t> ids;
  for (int i = 0; i < 512; ++i) {
    const auto id = sf.next_id(now);
    REQUIRE(id.has_value());
    ids.insert(id.value());
  }

  // Repeated attempts in the exhausted tick keep failing and never reissue a slot.
  for (int i = 0; i < 3; ++i) {
    const auto retry = sf.next_id(now);
    REQUIRE_FALSE(retry.has_value());
    CHECK(retry.error() == core::GenerationError::kSequenceExhausted);
  }
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    CHECK(state->sequence == 511);
    CHECK(state->elapsed_time == 100);
  }

  const auto next_tick = sf.next_id(now + 10ms);
  REQUIRE(next_tick.has_value());
  const auto parts = generator::decompose(next_tick.value());
  CHECK(parts.time == 101);
  CHECK(parts.sequence == 0);
  CHECK(ids.count(next_tick.value()) == 0);
}

// ── Time limit ──────────────────────────────────────────────────────────────

TEST_CASE("next_id: elapsed time at 2^39 fails with kTimeLimitExceeded", "[generator][limit]") {
  const auto start = start_instant();
  auto state = std::make_shared<generator::GeneratorState>(core::to_sonyflake_time(start), 1);
  state->elapsed_time = generator::kMaxElapsedTime;
  const generator::Sonyflake sf(state);

  const auto result = sf.next_id(start + 1s);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error() == core::GenerationError::kTimeLimitExceeded);
}

TEST_CASE("next_id: a clock 2^39 ticks past the start time fails with kTimeLimitExceeded",
          "[generator][limit]") {
  const auto sf = generator::Sonyflake(std::make_shared<generator::GeneratorState>(0, 1));

  const auto last_valid = sf.next_id(core::from_sonyflake_time(generator::kMaxElapsedTime - 1));
  REQUIRE(last_valid.has_value());
  CHECK(generator::decompose(last_valid.value()).time ==
        static_cast<std::uint64_t>(generator::kMaxElapsedTime - 1));

  const auto over = sf.next_id(core::from_sonyflake_time(generator::kMaxElapsedTime));
  REQUIRE_FALSE(over.has_value());
  CHECK(over.error() == core::GenerationError::kTimeLimitExceeded);
}

// ── Shared handles ──────────────────────────────────────────────────────────

TEST_CASE("Sonyflake: copies share one set of counters", "[generator][shared]") {
  const auto start = start_instant();
  const auto handle = make_generator(start, 11);
  const generator::Sonyflake copy = handle;  // NOLINT(performance-unnecessary-copy-initialization)
  const auto now = start + 1s;

  CHECK(copy == handle);
  CHECK_FALSE(copy == make_generator(start, 11));

  const auto a = handle.next_id(now);
  const auto b = copy.next_id(now);
  const auto c = handle.next_id(now);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(c.has_value());

  CHECK(generator::decompose(a.value()).sequence == 0);
  CHECK(generator::decompose(b.value()).sequence == 1);
  CHECK(generator::decompose(c.value()).sequence == 2);
}

TEST_CASE("Sonyflake: concurrent callers never receive duplicate IDs",
          "[generator][shared][concurrency]") {
  constexpr int kThreads = 8;
  constexpr int kIdsPerThread = 2000;

  core::SystemClock clock;
  const auto sf = make_generator(clock.now() - 1h, 77);

  std::vector<std::vector<std::uint64_t>> per_thread(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([sf, &per_thread, t]() {
      core::SystemClock thread_clock;
      auto& out = per_thread[t];
      out.reserve(kIdsPerThread);
      for (int i = 0; i < kIdsPerThread; ++i) {
        const auto id = generator::next_id_with_backoff(sf, thread_clock);
        if (id.has_value()) {
          out.push_back(id.value());
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::uint64_t> all;
  for (const auto& ids : per_thread) {
    CHECK(ids.size() == static_cast<std::size_t>(kIdsPerThread));
    for (std::size_t i = 1; i < ids.size(); ++i) {
      CHECK(ids[i] > ids[i - 1]);  // each thread observes increasing IDs
    }
    all.insert(ids.begin(), ids.end());
  }
  CHECK(all.size() == static_cast<std::size_t>(kThreads * kIdsPerThread));
}

// ── Derived queries ─────────────────────────────────────────────────────────

TEST_CASE("min_id_for_time: shifts elapsed ticks into the time field", "[generator][query]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 500);

  CHECK(sf.min_id_for_time(start + 1s) == (std::uint64_t{100} << generator::kTimeShift));
  CHECK(sf.min_id_for_time(start + 15ms) == (std::uint64_t{1} << generator::kTimeShift));
  CHECK(sf.min_id_for_time(start) == 0);
  CHECK(sf.min_id_for_time(start - 1h) == 0);
}

TEST_CASE("min_id_for_time: IDs minted at or after the instant are not smaller",
          "[generator][query]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 65535);
  const auto instant = start + 42s + 7ms;

  const auto id = sf.next_id(instant);
  REQUIRE(id.has_value());
  CHECK(id.value() >= sf.min_id_for_time(instant));
  CHECK(id.value() < sf.min_id_for_time(instant + 10ms));
}

TEST_CASE("to_time: recovers the mint instant at tick resolution", "[generator][query]") {
  const auto start = start_instant();
  const auto sf = make_generator(start, 2);

  const auto id = sf.next_id(start + 1234ms);
  REQUIRE(id.has_value());
  CHECK(sf.to_time(id.value()) == start + 1230ms);
  CHECK(sf.start_time() == core::to_sonyflake_time(start));
  CHECK(sf.machine_id() == 2);
}
