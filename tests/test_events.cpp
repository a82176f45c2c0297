#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <fmsim/events.hpp>

using Catch::Approx;
using namespace fmsim;

static MatchEvent ev(EventKind k, TeamSide t, std::optional<PlayerIndex> p = std::nullopt) {
  MatchEvent e;
  e.kind = k;
  e.team = t;
  e.player = p;
  return e;
}

TEST_CASE("Event names round-trip and tolerate spelling variants") {
  for (int i = 0; i < kEventKindCount; ++i) {
    const auto k = static_cast<EventKind>(i);
    REQUIRE(event_kind_from_string(to_string(k)) == k);
  }
  REQUIRE(event_kind_from_string(" Yellow-Card ") == EventKind::YellowCard);
  REQUIRE(event_kind_from_string("shot on target") == EventKind::ShotOnTarget);
  REQUIRE_FALSE(event_kind_from_string("penalty_shootout").has_value());
}

TEST_CASE("StatsSink tallies team and player counters") {
  StatsSink sink;
  sink.record(ev(EventKind::Pass, TeamSide::Home, 4));
  sink.record(ev(EventKind::Pass, TeamSide::Home, 4));
  sink.record(ev(EventKind::PassCompleted, TeamSide::Home, 4));
  sink.record(ev(EventKind::Shot, TeamSide::Away, 20));
  sink.record(ev(EventKind::Goal, TeamSide::Away, 20));
  sink.record(ev(EventKind::Corner, TeamSide::Home));
  sink.record(ev(EventKind::YellowCard, TeamSide::Away, 15));

  const MatchStats& s = sink.stats();
  REQUIRE(s.team(TeamSide::Home).passes_attempted == 2);
  REQUIRE(s.team(TeamSide::Home).passes_completed == 1);
  REQUIRE(s.pass_accuracy(TeamSide::Home) == Approx(0.5));
  REQUIRE(s.pass_accuracy(TeamSide::Away) == Approx(0.0));
  REQUIRE(s.team(TeamSide::Away).goals == 1);
  REQUIRE(s.team(TeamSide::Home).corners == 1);
  REQUIRE(s.team(TeamSide::Away).yellow_cards == 1);
  REQUIRE(s.player(20)->goals == 1);
  REQUIRE(s.player(4)->passes_attempted == 2);
  REQUIRE(s.player(22) == nullptr);
  REQUIRE(s.player(-1) == nullptr);
}

TEST_CASE("Possession share defaults to even and follows ticks") {
  StatsSink sink;
  REQUIRE(sink.stats().possession_share(TeamSide::Home) == Approx(0.5));
  sink.possession_tick(TeamSide::Home);
  sink.possession_tick(TeamSide::Home);
  sink.possession_tick(TeamSide::Home);
  sink.possession_tick(TeamSide::Away);
  sink.possession_tick(std::nullopt);
  REQUIRE(sink.stats().possession_share(TeamSide::Home) == Approx(0.75));
  REQUIRE(sink.stats().possession_share(TeamSide::Away) == Approx(0.25));

  sink.touch(3);
  sink.distance(3, 12.5);
  sink.distance(3, -4.0);   // ignored
  REQUIRE(sink.stats().player(3)->touches == 1);
  REQUIRE(sink.stats().player(3)->distance_m == Approx(12.5));

  sink.clear();
  REQUIRE(sink.stats().team(TeamSide::Home).possession_ticks == 0);
}

TEST_CASE("count_events filters by kind and team") {
  std::vector<MatchEvent> events = {
    ev(EventKind::Foul, TeamSide::Home), ev(EventKind::Foul, TeamSide::Away),
    ev(EventKind::Foul, TeamSide::Away), ev(EventKind::Tackle, TeamSide::Away)};
  REQUIRE(count_events(events, EventKind::Foul) == 3);
  REQUIRE(count_events(events, EventKind::Foul, TeamSide::Away) == 2);
  REQUIRE(count_events(events, EventKind::Goal) == 0);
}
