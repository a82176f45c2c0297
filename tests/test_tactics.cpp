#include <catch2/catch_test_macros.hpp>
#include <string>

#include <fmsim/tactics.hpp>

using namespace fmsim;

TEST_CASE("Forwards attack the goal, centre backs hold") {
  GoalAttributes avg;
  REQUIRE(select_offensive_goal(score_offensive_goals(PositionKey::ST, avg, false)) == OffensiveGoal::AttackGoal);
  REQUIRE(select_offensive_goal(score_offensive_goals(PositionKey::CB, avg, false)) == OffensiveGoal::HoldPosition);
  REQUIRE(select_offensive_goal(score_offensive_goals(PositionKey::CM, avg, false)) == OffensiveGoal::SupportTeammate);
}

TEST_CASE("User player is pushed toward the ball") {
  GoalAttributes a;
  auto plain = score_offensive_goals(PositionKey::CM, a, false);
  auto hero = score_offensive_goals(PositionKey::CM, a, true);
  const auto ball = static_cast<std::size_t>(OffensiveGoal::MoveToBall);
  const auto hold = static_cast<std::size_t>(OffensiveGoal::HoldPosition);
  REQUIRE(hero[ball] > plain[ball]);
  REQUIRE(hero[hold] < plain[hold]);
}

TEST_CASE("Pressing depends on distance to the ball") {
  GoalAttributes a;
  REQUIRE(select_defensive_goal(score_defensive_goals(PositionKey::ST, a, 5.0)) == DefensiveGoal::PressOpponent);
  REQUIRE(select_defensive_goal(score_defensive_goals(PositionKey::CB, a, 30.0)) == DefensiveGoal::HoldPosition);

  auto near = score_defensive_goals(PositionKey::CM, a, 5.0);
  auto far = score_defensive_goals(PositionKey::CM, a, 25.0);
  const auto press = static_cast<std::size_t>(DefensiveGoal::PressOpponent);
  REQUIRE(near[press] > far[press]);
}

TEST_CASE("Ties go to the fixed priority order") {
  GoalWeights flat{1.0, 1.0, 1.0, 1.0, 1.0};
  REQUIRE(select_offensive_goal(flat) == OffensiveGoal::AttackGoal);
  REQUIRE(select_defensive_goal(flat) == DefensiveGoal::PressOpponent);
  REQUIRE(select_defensive_goal_without_press(flat) == DefensiveGoal::MarkPlayer);

  GoalWeights press_only{9.0, 1.0, 1.0, 2.0, 1.0};
  REQUIRE(select_defensive_goal_without_press(press_only) == DefensiveGoal::BlockPassingLane);
  REQUIRE(std::string(to_string(DefensiveGoal::BlockPassingLane)) == "block_passing_lane");
}

TEST_CASE("Keepers never leave their position by choice") {
  GoalAttributes keen;
  keen.aggression = 100;
  keen.work_rate = 100;
  REQUIRE(select_offensive_goal(score_offensive_goals(PositionKey::GK, keen, false)) == OffensiveGoal::HoldPosition);
  REQUIRE(select_defensive_goal(score_defensive_goals(PositionKey::GK, keen, 1.0)) == DefensiveGoal::HoldPosition);
}
