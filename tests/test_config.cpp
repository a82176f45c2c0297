#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <fmsim/config.hpp>

using Catch::Approx;
using namespace fmsim;

TEST_CASE("Default config is a 90 minute match at 20 ticks per second") {
  EngineConfig cfg;
  REQUIRE_FALSE(validate_config(cfg).has_value());
  REQUIRE(cfg.ticks_per_half() == 54000);
  REQUIRE(cfg.total_ticks() == 108000);
  REQUIRE(cfg.substep_seconds() == Approx(0.01));
}

TEST_CASE("validate_config rejects impossible values") {
  EngineConfig cfg;

  SECTION("no substeps") {
    cfg.substeps = 0;
    REQUIRE(validate_config(cfg).has_value());
  }

  SECTION("negative tick") {
    cfg.tick_seconds = -1.0;
    REQUIRE(validate_config(cfg).has_value());
  }

  SECTION("header height above the keeper catch height") {
    cfg.header_max_m = 4.0;
    REQUIRE(validate_config(cfg).has_value());
  }

  SECTION("ball gains energy on a bounce") {
    cfg.ball.restitution = 1.5;
    REQUIRE(validate_config(cfg).has_value());
  }
}

TEST_CASE("apply_config_value sets known keys only") {
  EngineConfig cfg;

  SECTION("known keys, case-insensitive") {
    REQUIRE(apply_config_value(cfg, "match_minutes", "10"));
    REQUIRE(cfg.match_minutes == 10);
    REQUIRE(apply_config_value(cfg, "Ball.Restitution", "0.5"));
    REQUIRE(cfg.ball.restitution == Approx(0.5));
    REQUIRE(apply_config_value(cfg, "record_trace", "yes"));
    REQUIRE(cfg.record_trace);
  }

  SECTION("unknown keys and bad values leave the config alone") {
    REQUIRE_FALSE(apply_config_value(cfg, "warp_drive", "1"));
    REQUIRE_FALSE(apply_config_value(cfg, "substeps", "five"));
    REQUIRE(cfg.substeps == 5);
  }
}

TEST_CASE("engine_config_from_csv_stream overlays defaults and skips noise") {
  std::istringstream in(R"(key,value
# shorter match
match_minutes , 20
ball.max_bounces, 3
unknown_key,7
substeps,abc
)");
  auto cfg = engine_config_from_csv_stream(in);
  REQUIRE(cfg.match_minutes == 20);
  REQUIRE(cfg.ball.max_bounces == 3);
  REQUIRE(cfg.substeps == 5);
  REQUIRE(cfg.tick_seconds == Approx(0.05));
}

TEST_CASE("load_engine_config_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_engine_config_csv("does_not_exist_config.csv").has_value());
}
