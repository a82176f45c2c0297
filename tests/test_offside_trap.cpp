#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <fmsim/offside_trap.hpp>

using Catch::Approx;
using namespace fmsim;

TEST_CASE("Line height averages the deepest four") {
  REQUIRE(compute_line_height({30.0, 10.0, 20.0, 40.0, 50.0}) == Approx(25.0));
  REQUIRE(compute_line_height({12.0, 18.0}) == Approx(15.0));
  REQUIRE(compute_line_height({}) == Approx(0.0));
}

TEST_CASE("Trap needs a disciplined back line, a midfield ball and a nearby attacker") {
  OffsideTrapConfig cfg;
  DefensiveLine line;
  line.line_m = 30.0;
  std::vector<double> attackers = {33.0};

  REQUIRE(should_activate_trap(line, 50.0, attackers, 70.0, 70.0, cfg));
  REQUIRE_FALSE(should_activate_trap(line, 50.0, attackers, 60.0, 70.0, cfg));   // teamwork
  REQUIRE_FALSE(should_activate_trap(line, 50.0, attackers, 70.0, 50.0, cfg));   // concentration
  REQUIRE_FALSE(should_activate_trap(line, 20.0, attackers, 70.0, 70.0, cfg));   // ball too deep
  REQUIRE_FALSE(should_activate_trap(line, 50.0, {45.0}, 70.0, 70.0, cfg));      // nobody near the line
}

TEST_CASE("Trap line follows the ball within limits") {
  OffsideTrapConfig cfg;
  REQUIRE(compute_trap_line(45.0, cfg) == Approx(45.0));
  REQUIRE(compute_trap_line(10.0, cfg) == Approx(cfg.min_line_m));
  REQUIRE(compute_trap_line(90.0, cfg) == Approx(cfg.max_line_m));
}

TEST_CASE("update_defensive_line works in the defending team's frame") {
  DirectionContext away = DirectionContext::for_team(TeamSide::Away);   // own goal at x = 105
  std::vector<Coord10> defenders = {
    Coord10::from_meters(80.0, 10.0), Coord10::from_meters(82.0, 25.0),
    Coord10::from_meters(82.0, 43.0), Coord10::from_meters(80.0, 58.0)};
  std::vector<Coord10> attackers = {Coord10::from_meters(78.0, 34.0)};
  DefensiveLine line;

  update_defensive_line(line, away, defenders, attackers, Coord10::from_meters(55.0, 34.0),
                        50.0, 50.0, false, 7);
  REQUIRE(line.line_m == Approx(24.0));
  REQUIRE_FALSE(line.trap_active);
  REQUIRE(line.last_update_tick == 7);

  update_defensive_line(line, away, defenders, attackers, Coord10::from_meters(55.0, 34.0),
                        80.0, 80.0, true, 8);
  REQUIRE(line.trap_active);
  REQUIRE(line.line_m == Approx(50.0));
  REQUIRE(line.coordination == Approx(0.8));
}

TEST_CASE("Offside only beyond the second-last defender and the ball in the opponent half") {
  REQUIRE(would_be_offside(80.0, 75.0, 60.0));
  REQUIRE_FALSE(would_be_offside(75.0, 75.0, 60.0));   // level
  REQUIRE_FALSE(would_be_offside(80.0, 75.0, 85.0));   // behind the ball
  REQUIRE_FALSE(would_be_offside(50.0, 40.0, 30.0));   // own half
}
