#include "sonyflake/core/time.h"
#include "sonyflake/generator/decomposed_id_json.h"
#include "sonyflake/generator/layout.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>

using namespace sonyflake;

TEST_CASE("to_json: DecomposedId fields with sorted keys", "[json][generator]") {
  const auto parts = generator::decompose(generator::compose(100, 3, 42));
  REQUIRE(parts.id == 3355639850ULL);

  CHECK(generator::to_json(parts) ==
        R"({"id":3355639850,"machine_id":42,"nanos_time":1000000000,"sequence":3,"time":100})");
}

TEST_CASE("to_json: start time adds the absolute mint time", "[json][generator]") {
  const auto parts = generator::decompose(generator::compose(100, 0, 1));
  const auto start_ticks = core::to_sonyflake_time(core::default_epoch());

  const auto j = nlohmann::json::parse(generator::to_json(parts, start_ticks));
  CHECK(j.at("timestamp") == "2014-09-01T00:00:01Z");
  CHECK(j.at("time") == 100);
  CHECK(j.at("nanos_time") == 1'000'000'000);
}

TEST_CASE("to_json: largest ID is representable", "[json][generator]") {
  const auto parts = generator::decompose(~std::uint64_t{0});
  const auto j = nlohmann::json::parse(generator::to_json(parts));

  CHECK(j.at("id").get<std::uint64_t>() == ~std::uint64_t{0});
  CHECK(j.at("sequence") == 511);
  CHECK(j.at("machine_id") == 65535);
}
