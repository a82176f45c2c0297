#include <catch2/catch_test_macros.hpp>
#include <string>

#include <fmsim/setup_error.hpp>

using namespace fmsim;

static MatchPlan demo_plan() {
  MatchPlan plan;
  plan.home = demo_team("Home");
  plan.away = demo_team("Away", "4-3-3");
  plan.seed = 1;
  return plan;
}

TEST_CASE("Demo plan validates") {
  REQUIRE_FALSE(validate_match_plan(demo_plan()).has_value());
}

TEST_CASE("Unknown formation is rejected") {
  auto plan = demo_plan();
  plan.away.formation = "1-1-8";
  auto err = validate_match_plan(plan);
  REQUIRE(err.has_value());
  REQUIRE(err->kind == SetupErrorKind::UnknownFormation);
  REQUIRE(err->message.find("away") != std::string::npos);
}

TEST_CASE("Starter count, slots and keeper are checked") {
  auto plan = demo_plan();
  plan.home.starters.pop_back();
  REQUIRE(validate_match_plan(plan)->kind == SetupErrorKind::WrongStarterCount);

  plan = demo_plan();
  plan.home.starters[4].slot = 3;
  REQUIRE(validate_match_plan(plan)->kind == SetupErrorKind::DuplicateSlot);

  plan = demo_plan();
  plan.home.starters[4].slot = 11;
  REQUIRE(validate_match_plan(plan)->kind == SetupErrorKind::SlotOutOfRange);

  plan = demo_plan();
  plan.home.starters[0].position = PositionKey::CB;
  REQUIRE(validate_match_plan(plan)->kind == SetupErrorKind::MissingGoalkeeper);
}

TEST_CASE("Attributes and user player must be in range") {
  auto plan = demo_plan();
  plan.away.starters[7].attr.pace = 140.0;
  REQUIRE(validate_match_plan(plan)->kind == SetupErrorKind::AttributeOutOfRange);

  plan = demo_plan();
  plan.home.subs[2].stamina = 1.5;
  REQUIRE(validate_match_plan(plan)->kind == SetupErrorKind::AttributeOutOfRange);

  plan = demo_plan();
  plan.user_player = 22;
  REQUIRE(validate_match_plan(plan)->kind == SetupErrorKind::SlotOutOfRange);
}

TEST_CASE("SetupErrorKind names are snake case") {
  REQUIRE(std::string(to_string(SetupErrorKind::ScenarioOutOfBounds)) == "scenario_out_of_bounds");
  REQUIRE(std::string(to_string(SetupErrorKind::InvalidConfig)) == "invalid_config");
}
