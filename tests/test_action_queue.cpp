#include <catch2/catch_test_macros.hpp>
#include <string>

#include <fmsim/action_queue.hpp>

using namespace fmsim;

TEST_CASE("ActionQueue keeps one pending action per player") {
  ActionQueue q;
  auto a = q.schedule(ScheduledKind::Pass, 4, 10, 12, Coord10::center());
  REQUIRE(a.has_value());
  REQUIRE_FALSE(q.schedule(ScheduledKind::Shot, 4, 10, 11, Coord10::center()).has_value());
  REQUIRE(q.has_active(4));
  REQUIRE(q.active_for(4)->kind == ScheduledKind::Pass);
  REQUIRE(q.active_for(5) == nullptr);

  // completion before start is rejected
  REQUIRE_FALSE(q.schedule(ScheduledKind::Cross, 5, 20, 19, Coord10::center()).has_value());
  REQUIRE(q.size() == 1);
}

TEST_CASE("pop_due returns due actions ordered by completion then id") {
  ActionQueue q;
  ActionPayload pl;
  pl.receiver = 7;
  auto late = q.schedule(ScheduledKind::Shot, 1, 0, 5, Coord10::center());
  auto first = q.schedule(ScheduledKind::Pass, 2, 0, 3, Coord10::center(), pl);
  auto second = q.schedule(ScheduledKind::Dribble, 3, 0, 3, Coord10::center());
  auto future = q.schedule(ScheduledKind::Cross, 4, 0, 9, Coord10::center());
  REQUIRE((late && first && second && future));

  auto due = q.pop_due(5);
  REQUIRE(due.size() == 3);
  REQUIRE(due[0].id == *first);
  REQUIRE(due[0].payload.receiver == 7);
  REQUIRE(due[1].id == *second);
  REQUIRE(due[2].id == *late);
  REQUIRE(q.size() == 1);
  REQUIRE(q.pop_due(5).empty());
}

TEST_CASE("Cancelled actions never fire") {
  ActionQueue q;
  auto a = q.schedule(ScheduledKind::Tackle, 12, 0, 1, Coord10::center());
  q.schedule(ScheduledKind::Save, 11, 0, 1, Coord10::center());
  REQUIRE(q.cancel(*a));
  REQUIRE_FALSE(q.cancel(*a));
  REQUIRE(q.cancel_for(11));
  REQUIRE(q.empty());
  REQUIRE(q.pop_due(100).empty());

  // the player is free to act again
  REQUIRE(q.schedule(ScheduledKind::Pass, 12, 2, 3, Coord10::center()).has_value());
  REQUIRE(std::string(to_string(ScheduledKind::Dribble)) == "dribble");
}
