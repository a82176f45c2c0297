#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <variant>

#include <fmsim/engine.hpp>

using Catch::Approx;
using namespace fmsim;

static MatchPlan demo_plan(std::uint64_t seed) {
  MatchPlan plan;
  plan.home = demo_team("Rovers", "4-4-2", 68.0);
  plan.away = demo_team("United", "4-3-3", 66.0);
  plan.seed = seed;
  return plan;
}

static EngineConfig short_match() {
  EngineConfig cfg;
  cfg.match_minutes = 2;   // 1200 ticks per half
  cfg.record_trace = true;
  return cfg;
}

TEST_CASE("create_match_engine rejects a bad config or plan") {
  EngineConfig cfg;
  cfg.substeps = 0;
  auto bad_cfg = create_match_engine(demo_plan(1), cfg);
  REQUIRE(std::holds_alternative<SetupError>(bad_cfg));
  REQUIRE(std::get<SetupError>(bad_cfg).kind == SetupErrorKind::InvalidConfig);

  auto plan = demo_plan(1);
  plan.home.formation = "9-0-1";
  auto bad_plan = create_match_engine(plan);
  REQUIRE(std::holds_alternative<SetupError>(bad_plan));
  REQUIRE(std::get<SetupError>(bad_plan).kind == SetupErrorKind::UnknownFormation);

  REQUIRE(std::holds_alternative<SetupError>(simulate_match(plan)));
}

TEST_CASE("MatchEngine starts with a home kickoff from the centre spot") {
  auto made = create_match_engine(demo_plan(5), short_match());
  REQUIRE(std::holds_alternative<MatchEngine>(made));
  const MatchEngine& m = std::get<MatchEngine>(made);

  REQUIRE(m.tick() == 0);
  REQUIRE(m.half() == 1);
  REQUIRE(m.minute() == 0);
  REQUIRE_FALSE(m.finished());
  REQUIRE(m.events().size() == 1);
  REQUIRE(m.events()[0].kind == EventKind::KickOff);
  REQUIRE(m.events()[0].team == TeamSide::Home);

  REQUIRE(m.ball_owner().has_value());
  REQUIRE(team_of(*m.ball_owner()) == TeamSide::Home);
  REQUIRE(m.ball().pos == Coord10::center());
  REQUIRE(m.possession_team() == TeamSide::Home);

  // everyone but the kicker starts in their own half
  for (PlayerIndex i = 0; i < kPlayerCount; ++i) {
    const PlayerState* p = m.player_by_index(i);
    REQUIRE(p != nullptr);
    if (i == *m.ball_owner()) continue;
    REQUIRE(m.direction_for(p->team()).in_own_half(p->pos));
  }
  REQUIRE(m.player_by_index(22) == nullptr);
  REQUIRE(m.player_by_index(-1) == nullptr);
  REQUIRE(m.player_by_index(0)->role == PositionRole::Goalkeeper);
}

TEST_CASE("Positions stay on the pitch for a whole short match") {
  auto made = create_match_engine(demo_plan(21), short_match());
  MatchEngine& m = std::get<MatchEngine>(made);
  while (m.step()) {
    REQUIRE(m.ball().pos.in_bounds_with_margin());
    for (PlayerIndex i = 0; i < kPlayerCount; ++i) {
      const PlayerState* p = m.player_by_index(i);
      if (!p->active()) continue;
      REQUIRE(p->pos.in_bounds());
      REQUIRE(p->stamina >= 0.2);
      REQUIRE(p->stamina <= 1.0);
    }
  }
  REQUIRE(m.finished());
}

TEST_CASE("Half time swaps directions and full time ends the match") {
  auto made = create_match_engine(demo_plan(8), short_match());
  MatchEngine& m = std::get<MatchEngine>(made);
  REQUIRE(m.direction_for(TeamSide::Home).attacks_right);

  REQUIRE(m.run_ticks(1200) == 1200);
  REQUIRE(m.half() == 2);
  REQUIRE(m.has_event(EventKind::HalfTime));
  REQUIRE_FALSE(m.direction_for(TeamSide::Home).attacks_right);
  REQUIRE(m.direction_for(TeamSide::Away).attacks_right);
  REQUIRE(m.events().back().kind == EventKind::KickOff);
  REQUIRE(m.events().back().team == TeamSide::Away);
  REQUIRE(m.minute() == 45);

  m.run_to_end();
  REQUIRE(m.finished());
  REQUIRE(m.tick() == 2400);
  REQUIRE(m.minute() == 90);
  REQUIRE(m.has_event("full_time"));
  REQUIRE_FALSE(m.step());
  REQUIRE(m.run_ticks(10) == 0);
}

TEST_CASE("Same seed replays the same match") {
  auto a = simulate_match(demo_plan(42), short_match());
  auto b = simulate_match(demo_plan(42), short_match());
  REQUIRE(std::holds_alternative<MatchResult>(a));
  REQUIRE(std::holds_alternative<MatchResult>(b));
  const MatchResult& ra = std::get<MatchResult>(a);
  const MatchResult& rb = std::get<MatchResult>(b);

  REQUIRE(ra.score == rb.score);
  REQUIRE(ra.events == rb.events);
  REQUIRE(ra.trace.has_value());
  REQUIRE(ra.trace == rb.trace);
  REQUIRE(ra.ticks_played == 2400);
  REQUIRE(ra.trace->frames.size() == 2401);
  REQUIRE(ra.trace->frame_at(0) != nullptr);
  REQUIRE(ra.trace->frame_at(2400) != nullptr);
  REQUIRE(ra.trace->frame_at(2401) == nullptr);

  auto c = simulate_match(demo_plan(43), short_match());
  REQUIRE(std::get<MatchResult>(c).trace != ra.trace); // highly likely, acceptable for micro tests
}

TEST_CASE("Match result carries consistent statistics") {
  auto r = simulate_match(demo_plan(7), short_match());
  const MatchResult& res = std::get<MatchResult>(r);
  REQUIRE(res.home_name == "Rovers");
  REQUIRE(res.away_name == "United");
  REQUIRE(res.seed == 7);

  const auto& s = res.stats;
  REQUIRE(s.possession_share(TeamSide::Home) + s.possession_share(TeamSide::Away) == Approx(1.0));
  REQUIRE(s.team(TeamSide::Home).goals == res.score.home);
  REQUIRE(s.team(TeamSide::Away).goals == res.score.away);
  REQUIRE(count_events(res.events, EventKind::Goal, TeamSide::Home) == std::size_t(res.score.home));
  for (TeamSide side : {TeamSide::Home, TeamSide::Away}) {
    REQUIRE(s.team(side).passes_completed <= s.team(side).passes_attempted);
    REQUIRE(s.team(side).shots_on_target <= s.team(side).shots);
  }
  REQUIRE(count_events(res.events, EventKind::Pass) > 0);

  // events are in tick order
  for (std::size_t i = 1; i < res.events.size(); ++i) REQUIRE(res.events[i - 1].tick <= res.events[i].tick);
}

TEST_CASE("Named metrics expose live match state") {
  auto made = create_match_engine(demo_plan(3), short_match());
  MatchEngine& m = std::get<MatchEngine>(made);
  m.run_ticks(40);
  REQUIRE(*m.metric("tick") == Approx(40.0));
  REQUIRE(*m.metric("half") == Approx(1.0));
  REQUIRE(*m.metric("home_goals") == Approx(double(m.score().home)));
  REQUIRE(*m.metric("ball_x_m") == Approx(m.ball().pos.x_m()));
  REQUIRE(*m.metric("possession_home") + *m.metric("possession_away") == Approx(1.0));
  REQUIRE(*m.metric("events") == Approx(double(m.events().size())));
  REQUIRE_FALSE(m.metric("crowd_noise").has_value());
}

TEST_CASE("Engine logs kickoff and full time through the supplied logger") {
  std::ostringstream out;
  log::Logger logger(out, log::level::info);
  EngineConfig cfg = short_match();
  cfg.record_trace = false;
  auto r = simulate_match(demo_plan(11), cfg, &logger);
  REQUIRE(std::holds_alternative<MatchResult>(r));
  REQUIRE_FALSE(std::get<MatchResult>(r).trace.has_value());
  const std::string text = out.str();
  REQUIRE(text.find("kickoff: Rovers") != std::string::npos);
  REQUIRE(text.find("half time") != std::string::npos);
  REQUIRE(text.find("full time") != std::string::npos);
}

TEST_CASE("Top speed depends on pace and stamina") {
  PlayerState p;
  p.attr.pace = 100;
  p.stamina = 1.0;
  REQUIRE(p.top_speed_mps() == Approx(9.0));
  p.stamina = 0.0;
  REQUIRE(p.top_speed_mps() == Approx(6.3));
  REQUIRE(std::string(to_string(RestartKind::GoalKick)) == "goal_kick");
}

TEST_CASE("Full matches stay within a football scoreline") {
  for (std::uint64_t seed : {3u, 17u, 101u}) {
    auto r = simulate_match(demo_plan(seed));
    REQUIRE(std::holds_alternative<MatchResult>(r));
    const MatchResult& res = std::get<MatchResult>(r);
    REQUIRE(res.ticks_played == 108000);
    REQUIRE(res.score.home + res.score.away <= 10);
    for (TeamSide side : {TeamSide::Home, TeamSide::Away}) {
      REQUIRE(res.stats.team(side).shots_on_target <= res.stats.team(side).shots);
    }

    // an interception always follows the kick it cuts out
    std::optional<std::uint64_t> last_kick;
    for (const MatchEvent& e : res.events) {
      if (e.kind == EventKind::Pass || e.kind == EventKind::Cross) last_kick = e.tick;
      if (e.kind != EventKind::Interception) continue;
      REQUIRE(last_kick.has_value());
      REQUIRE(e.tick > *last_kick);
    }
  }
}
