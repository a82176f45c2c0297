#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <fmsim/diagnostics.hpp>
#include <fmsim/log.hpp>

using namespace fmsim;

TEST_CASE("Logger formats placeholders and filters by level") {
  std::ostringstream out;
  log::Logger logger(out, log::level::info);
  std::vector<std::string> seen;
  logger.set_callback([&](log::level, const std::string& m) { seen.push_back(m); });

  logger.debug("hidden {}", 1);
  logger.info("tick {}: {} at {} m", 12, "pass", 3.5);
  logger.warn("extra", 7);
  REQUIRE(seen.size() == 2);
  REQUIRE(seen[0] == "tick 12: pass at 3.500 m");
  REQUIRE(seen[1] == "extra 7");
  REQUIRE(out.str().find("[I ") != std::string::npos);
  REQUIRE(out.str().find("hidden") == std::string::npos);

  logger.set_level(log::level::error);
  REQUIRE_FALSE(logger.enabled(log::level::warn));
  logger.set_level(log::level::debug);
  logger.debug("flag {}", true);
  REQUIRE(seen.back() == "flag true");
}

TEST_CASE("Level names parse loosely") {
  REQUIRE(log::parse_level("DEBUG") == log::level::debug);
  REQUIRE(log::parse_level("warning") == log::level::warn);
  REQUIRE(log::parse_level("err") == log::level::error);
  REQUIRE(log::parse_level("chatty") == log::level::info);
  REQUIRE(std::string(log::level_name(log::level::warn)) == "warn");
}

TEST_CASE("DiagnosticSink counts and gates") {
  DiagnosticSink d;
  d.increment("first_touch_heavy");
  d.increment("first_touch_heavy", 2);
  REQUIRE(d.count("first_touch_heavy") == 3);
  REQUIRE(d.count("never") == 0);

  REQUIRE(d.first_time("action_dropped"));
  REQUIRE_FALSE(d.first_time("action_dropped"));
  REQUIRE(d.counters().size() == 1);

  d.clear();
  REQUIRE(d.counters().empty());
  REQUIRE(d.first_time("action_dropped"));
}
