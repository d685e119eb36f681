#include "generate.h"

#include "sonyflake/config/builder.h"
#include "sonyflake/config/generator_config.h"
#include "sonyflake/core/clock.h"
#include "sonyflake/core/errors.h"
#include "sonyflake/core/time.h"
#include "sonyflake/generator/mint.h"
#include "sonyflake/machine/redis_config.h"
#include "sonyflake/machine/redis_machine_id_lease.h"

#include "cli_values.h"
#include "shared/arg_parser.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::uint64_t kMaxCount = 10'000'000;

struct GenerateCliConfig {
  std::uint64_t count{1};
  std::optional<std::string> config_path;
  std::optional<sonyflake::core::Timestamp> start_time;
  std::optional<std::uint16_t> machine_id;
  std::optional<std::string> redis_uri;
  bool verbose{false};
};

std::vector<sonyflake::apps::Option<GenerateCliConfig>> generate_options() {
  return {
      {"--count", true, "Number of IDs to generate (default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto n = parse_unsigned_flag("--count", v, kMaxCount);
         if (!n.has_value() || n.value() == 0) {
           if (n.has_value()) {
             std::cerr << "Invalid --count: must be at least 1\n";
           }
           return false;
         }
         c.count = n.value();
         return true;
       }},
      {"--start-time", true, "Generator epoch, UTC ISO 8601 (default 2014-09-01T00:00:00Z)",
       [](GenerateCliConfig& c, const std::string& v) {
         c.start_time = parse_time_flag("--start-time", v);
         return c.start_time.has_value();
       }},
      {"--machine-id", true, "Fixed machine id (0..65535)",
       [](GenerateCliConfig& c, const std::string& v) {
         c.machine_id = parse_machine_id_flag("--machine-id", v);
         return c.machine_id.has_value();
       }},
      {"--config", true, "Path to a JSON generator configuration file",
       [](GenerateCliConfig& c, const std::string& v) {
         c.config_path = v;
         return true;
       }},
      {"--redis", true, "Lease the machine id from Redis (e.g. tcp://127.0.0.1:6379)",
       [](GenerateCliConfig& c, const std::string& v) {
         if (!sonyflake::machine::parse_redis_uri(v).has_value()) {
           std::cerr << "Invalid --redis: '" << v << "'\n"
                     << "Accepted formats: tcp://host:port, redis://host:port, tcp://host\n";
           return false;
         }
         c.redis_uri = v;
         return true;
       }},
      {"--verbose", false, "Print the resolved configuration to stderr",
       [](GenerateCliConfig& c, const std::string&) {
         c.verbose = true;
         return true;
       }},
  };
}

// Merge file configuration with flags; flags win.
std::optional<sonyflake::config::GeneratorConfig> resolve_config(const GenerateCliConfig& cli) {
  sonyflake::config::GeneratorConfig config;
  if (cli.config_path.has_value()) {
    auto loaded = sonyflake::config::load_generator_config(cli.config_path.value());
    if (!loaded.has_value()) {
      std::cerr << "Error: " << loaded.error() << "\n";
      return std::nullopt;
    }
    config = loaded.value();
  }

  if (cli.machine_id.has_value() && cli.redis_uri.has_value()) {
    std::cerr << "Error: --machine-id and --redis cannot be combined\n";
    return std::nullopt;
  }
  if (cli.start_time.has_value()) {
    config.start_time = cli.start_time;
  }
  if (cli.machine_id.has_value()) {
    config.machine_id = cli.machine_id;
    config.redis.reset();
  }
  if (cli.redis_uri.has_value()) {
    sonyflake::config::RedisLeaseConfig redis =
        config.redis.value_or(sonyflake::config::RedisLeaseConfig{});
    redis.uri = cli.redis_uri.value();
    config.redis = redis;
    config.machine_id.reset();
  }
  return config;
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = generate_options();
  auto parsed = sonyflake::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positionals.empty()) {
    sonyflake::apps::print_usage(std::cerr, "sonyflake_cli generate [options]", options);
    return 1;
  }
  const auto& cli = parsed.config;

  const auto config = resolve_config(cli);
  if (!config.has_value()) {
    return 1;
  }

  sonyflake::config::Builder builder;
  sonyflake::config::apply_generator_config(config.value(), builder);

  // The lease must outlive every ID minted with its machine id.
  std::unique_ptr<sonyflake::machine::RedisMachineIdLease> lease;
  if (config->redis.has_value()) {
    try {
      lease = std::make_unique<sonyflake::machine::RedisMachineIdLease>(
          config->redis->uri, sonyflake::config::to_lease_options(config->redis.value()));
    } catch (const std::runtime_error& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
    builder.machine_id([&lease]() { return lease->acquire(); });
  }

  sonyflake::core::SystemClock clock;
  const auto built = builder.finalize(clock);
  if (!built.has_value()) {
    std::cerr << "Error: " << sonyflake::core::describe(built.error()) << "\n";
    return 1;
  }
  const auto& generator = built.value();

  if (cli.verbose) {
    std::cerr << "start_time: "
              << sonyflake::core::format_iso8601(
                     sonyflake::core::from_sonyflake_time(generator.start_time()))
              << "\n";
    std::cerr << "machine_id: " << generator.machine_id()
              << (lease ? " (redis lease)" : config->machine_id ? " (configured)" : " (host ip)")
              << "\n";
    if (lease) {
      std::cerr << "redis: "
                << sonyflake::config::lease_config_to_log_string(config->redis.value()) << "\n";
    }
  }

  sonyflake::generator::MintOptions mint_options{.count = cli.count};
  if (lease) {
    // Keep the machine id exclusive for as long as IDs are being minted with it.
    mint_options.renew_interval = sonyflake::generator::renew_interval_for(
        std::chrono::seconds{config->redis->lease_ttl_seconds});
    mint_options.renew = [&lease]() { return lease->renew(); };
  }

  const auto minted = sonyflake::generator::mint_ids(
      generator, clock, mint_options, [](std::uint64_t id) { std::cout << id << "\n"; });
  if (!minted.has_value()) {
    std::cerr << "Error: " << minted.error() << "\n";
    return 1;
  }

  return 0;
}
