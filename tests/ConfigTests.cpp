#include <chrono>

#include <catch2/catch.hpp>

#include "EventSystemConfig.hpp"
#include "Log.hpp"

TEST_CASE("A full configuration is read", "[config]") {
  const EventSystemConfig config = ParseEventSystemConfig(R"(
log_level: debug
event_bus:
  strict_loop_detection: true
  loop_threshold: 25
  loop_window_ms: 500
  worker_threads: 2
relationships:
  auto_save: false
  update_mutual_relationships: false
  mutual_strength_factor: 0.5
)");

  CHECK(config.log_level == spdlog::level::debug);
  CHECK(config.event_bus.loop_detection.strict);
  CHECK(config.event_bus.loop_detection.threshold == 25);
  CHECK(config.event_bus.loop_detection.window == std::chrono::milliseconds(500));
  CHECK(config.worker_threads == 2);
  CHECK_FALSE(config.relationships.auto_save);
  CHECK_FALSE(config.relationships.update_mutual_relationships);
  CHECK(config.relationships.mutual_strength_factor == Approx(0.5));
}

TEST_CASE("Missing keys keep their defaults", "[config]") {
  const EventSystemConfig empty = ParseEventSystemConfig("");
  CHECK(empty.log_level == spdlog::level::info);
  CHECK(empty.event_bus.loop_detection.threshold == 10);
  CHECK(empty.event_bus.loop_detection.window == std::chrono::milliseconds(1000));
  CHECK_FALSE(empty.event_bus.loop_detection.strict);
  CHECK(empty.relationships.mutual_strength_factor == Approx(0.8));

  const EventSystemConfig partial = ParseEventSystemConfig("event_bus:\n  loop_threshold: 3\n");
  CHECK(partial.event_bus.loop_detection.threshold == 3);
  CHECK(partial.worker_threads == 4);
  CHECK(partial.relationships.auto_save);
}

TEST_CASE("Invalid values raise ConfigError", "[config]") {
  CHECK_THROWS_AS(ParseEventSystemConfig("log_level: loud\n"), ConfigError);
  CHECK_THROWS_AS(ParseEventSystemConfig("event_bus:\n  loop_threshold: 0\n"), ConfigError);
  CHECK_THROWS_AS(ParseEventSystemConfig("event_bus:\n  strict_loop_detection: maybe\n"), ConfigError);
  CHECK_THROWS_AS(ParseEventSystemConfig("relationships:\n  mutual_strength_factor: 1.5\n"), ConfigError);
  CHECK_THROWS_AS(ParseEventSystemConfig("- just\n- a list\n"), ConfigError);
  CHECK_THROWS_AS(ParseEventSystemConfig("event_bus: [unclosed\n"), ConfigError);
}

TEST_CASE("Loading a missing file raises ConfigError", "[config]") {
  CHECK_THROWS_AS(LoadEventSystemConfig("/nonexistent/charbus.yaml"), ConfigError);
}

TEST_CASE("Log levels parse from their config names", "[config][log]") {
  CHECK(Log::ParseLevel("warning") == spdlog::level::warn);
  CHECK(Log::ParseLevel("error") == spdlog::level::err);
  CHECK_FALSE(Log::ParseLevel("verbose").has_value());
}

TEST_CASE("Log::Init installs the charbus logger as the default", "[log]") {
  Log::Init(spdlog::level::warn);
  CHECK(Log::Get()->name() == "charbus");
  CHECK(spdlog::default_logger()->name() == "charbus");

  Log::SetLevel(spdlog::level::err);
  CHECK(Log::Get()->level() == spdlog::level::err);
}
