#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <variant>

#include <fmsim/scenario.hpp>

using Catch::Approx;
using namespace fmsim;

static MatchPlan demo_plan() {
  MatchPlan plan;
  plan.home = demo_team("Home");
  plan.away = demo_team("Away");
  plan.seed = 2024;
  return plan;
}

static PlayerOverride placed(PlayerIndex idx, double x, double y) {
  PlayerOverride po;
  po.idx = idx;
  po.pos_m = Vec2{x, y};
  return po;
}

static PlayerOverride standing(PlayerIndex idx, double x, double y) {
  PlayerOverride po = placed(idx, x, y);
  po.vel_mps = Vec2{0.0, 0.0};
  po.scripted = true;
  return po;
}

// One scripted runner walking at 2 m/s toward a loose ball 15 m away.
static ScenarioSetup approach_setup() {
  ScenarioSetup s;
  PlayerOverride runner = placed(5, kFieldLengthM * 0.5 - 15.0, kFieldWidthM * 0.5);
  runner.vel_mps = Vec2{2.0, 0.0};
  runner.scripted = true;
  s.players.push_back(runner);
  s.ball = BallOverride{};
  s.only_listed_players = true;
  return s;
}

TEST_CASE("validate_scenario rejects positions off the pitch") {
  ScenarioSetup s;
  s.players.push_back(placed(3, 110.0, 20.0));
  auto err = validate_scenario(s);
  REQUIRE(err.has_value());
  REQUIRE(err->kind == SetupErrorKind::ScenarioOutOfBounds);

  s.players[0] = placed(3, -0.5, 68.5);   // inside the margin
  REQUIRE_FALSE(validate_scenario(s).has_value());

  s.players[0].idx = 22;
  REQUIRE(validate_scenario(s)->kind == SetupErrorKind::SlotOutOfRange);

  ScenarioSetup ball_only;
  ball_only.ball = BallOverride{};
  ball_only.ball->height_m = 60.0;
  REQUIRE(validate_scenario(ball_only)->kind == SetupErrorKind::ScenarioOutOfBounds);

  auto made = create_scenario_engine(demo_plan(), EngineConfig{}, ball_only);
  REQUIRE(std::holds_alternative<SetupError>(made));
}

TEST_CASE("Scripted runner claims the ball once strictly inside five metres") {
  auto made = create_scenario_engine(demo_plan(), EngineConfig{}, approach_setup());
  REQUIRE(std::holds_alternative<MatchEngine>(made));
  MatchEngine& m = std::get<MatchEngine>(made);
  REQUIRE_FALSE(m.ball_owner().has_value());
  REQUIRE_FALSE(m.player_by_index(0)->active());
  REQUIRE(m.player_by_index(5)->active());

  m.run_ticks(100);
  // exactly 5.0 m away: not yet a candidate
  REQUIRE(m.player_by_index(5)->pos.distance_to_m(m.ball().pos) == Approx(5.0));
  REQUIRE_FALSE(m.ball_owner().has_value());

  m.step();
  REQUIRE(m.tick() == 101);
  REQUIRE(m.ball_owner() == 5);
  REQUIRE(m.ball().pos == m.player_by_index(5)->pos);
  REQUIRE(*m.metric("ball_owner") == Approx(5.0));

  ScenarioExpectations ex;
  ex.ball_owner = std::optional<PlayerIndex>{5};
  ex.ball_pos_m = Vec2{47.6, 34.0};
  ex.score = Score{0, 0};
  REQUIRE(check_expectations(m, ex).empty());
}

TEST_CASE("Forced pass reaches its receiver") {
  ScenarioSetup s;
  s.players.push_back(placed(5, 50.0, 34.0));
  s.players.push_back(placed(6, 65.0, 34.0));
  s.ball = BallOverride{};
  s.ball->owner = 5;
  s.only_listed_players = true;

  auto made = create_scenario_engine(demo_plan(), EngineConfig{}, s);
  MatchEngine& m = std::get<MatchEngine>(made);
  REQUIRE(m.ball_owner() == 5);

  REQUIRE_FALSE(apply_forced_pass(m, ForcedPass{5, 14}));   // opponent
  REQUIRE_FALSE(apply_forced_pass(m, ForcedPass{6, 5}));    // 6 does not have the ball
  REQUIRE(apply_forced_pass(m, ForcedPass{5, 6}));

  m.step();
  REQUIRE(m.has_event(EventKind::Pass));
  REQUIRE(m.events().back().player == 5);
  REQUIRE(m.events().back().other == 6);
  REQUIRE_FALSE(m.ball_owner().has_value());

  for (int t = 0; t < 200 && !m.has_event(EventKind::PassCompleted); ++t) m.step();
  REQUIRE(m.event_count(EventKind::PassCompleted, TeamSide::Home) == 1);
  REQUIRE(m.stats().team(TeamSide::Home).passes_completed == 1);
}

TEST_CASE("Forced restart hands the ball to the nearest taker") {
  auto made = create_scenario_engine(demo_plan(), EngineConfig{}, ScenarioSetup{});
  MatchEngine& m = std::get<MatchEngine>(made);

  REQUIRE_FALSE(apply_forced_restart(m, ForcedRestart{RestartKind::Corner, TeamSide::Home, Vec2{120.0, 0.0}}));
  REQUIRE(apply_forced_restart(m, ForcedRestart{RestartKind::Corner, TeamSide::Home, Vec2{kFieldLengthM, 0.0}}));
  REQUIRE(m.has_event(EventKind::Corner));
  REQUIRE(m.events().back().team == TeamSide::Home);
  REQUIRE(m.ball_owner().has_value());
  REQUIRE(team_of(*m.ball_owner()) == TeamSide::Home);
  REQUIRE(m.player_by_index(*m.ball_owner())->role != PositionRole::Goalkeeper);
  REQUIRE(m.ball().pos.x_m() == Approx(kFieldLengthM));
  REQUIRE(m.ball().pos.y_m() == Approx(0.0));

  REQUIRE(apply_forced_restart(m, ForcedRestart{RestartKind::GoalKick, TeamSide::Away, Vec2{99.5, 34.0}}));
  REQUIRE(m.ball_owner() == player_index(TeamSide::Away, 0));
  REQUIRE(m.event_count(EventKind::GoalKick, TeamSide::Away) == 1);
}

TEST_CASE("check_expectations reports every mismatch") {
  auto made = create_scenario_engine(demo_plan(), EngineConfig{}, approach_setup());
  MatchEngine& m = std::get<MatchEngine>(made);

  ScenarioExpectations ex;
  ex.events.push_back(EventExpectation{EventKind::Goal, TeamSide::Home});
  ex.events.push_back(EventExpectation{EventKind::KickOff, std::nullopt, 1, std::size_t{1}});
  ex.score = Score{1, 0};
  ex.ball_owner = std::optional<PlayerIndex>{};   // must be loose
  ex.ball_pos_m = Vec2{10.0, 10.0};

  auto misses = check_expectations(m, ex);
  REQUIRE(misses.size() == 3);
  REQUIRE(misses[0].find("goal (home)") != std::string::npos);
  REQUIRE(misses[1].find("score") != std::string::npos);
  REQUIRE(misses[2].find("ball position") != std::string::npos);
}

TEST_CASE("Removed and scripted players can be injected with velocity") {
  ScenarioSetup s;
  PlayerOverride gone;
  gone.idx = 16;
  gone.remove = true;
  s.players.push_back(gone);
  PlayerOverride drifter = placed(20, 30.0, 60.0);
  drifter.vel_mps = Vec2{0.0, 4.0};
  drifter.scripted = true;
  s.players.push_back(drifter);

  auto made = create_scenario_engine(demo_plan(), EngineConfig{}, s);
  MatchEngine& m = std::get<MatchEngine>(made);
  REQUIRE_FALSE(m.player_by_index(16)->active());
  REQUIRE(m.player_by_index(16)->removed);

  m.run_ticks(60);
  // scripted movement is clamped at the touchline
  REQUIRE(m.player_by_index(20)->pos.y_m() == Approx(kFieldWidthM));
  REQUIRE(m.player_by_index(20)->pos.x_m() == Approx(30.0));
}

TEST_CASE("A pressed passer's ball is not lost at the kick spot") {
  ScenarioSetup s;
  s.players.push_back(placed(5, 50.0, 34.0));
  s.players.push_back(placed(6, 65.0, 34.0));
  s.players.push_back(standing(14, 50.0, 37.0));   // marker three metres off the passer
  s.ball = BallOverride{};
  s.ball->owner = 5;
  s.only_listed_players = true;

  auto made = create_scenario_engine(demo_plan(), EngineConfig{}, s);
  MatchEngine& m = std::get<MatchEngine>(made);
  REQUIRE(apply_forced_pass(m, ForcedPass{5, 6}));
  m.step();
  const std::uint64_t kick = m.tick();
  REQUIRE(m.event_count(EventKind::Pass) == 1);
  REQUIRE(m.events().back().tick == kick);

  SECTION("nothing happens to the ball on the kick tick") {
    REQUIRE_FALSE(m.ball_owner().has_value());
    REQUIRE(m.event_count(EventKind::Interception) == 0);
  }

  SECTION("the marker behind the ball never gets it") {
    for (int t = 0; t < 200 && !m.ball_owner(); ++t) m.step();
    REQUIRE(m.ball_owner() == 6);
    REQUIRE(m.event_count(EventKind::Interception) == 0);
    REQUIRE(m.event_count(EventKind::PassCompleted, TeamSide::Home) == 1);
  }
}

TEST_CASE("A defender standing in the passing lane can cut the pass out") {
  int intercepted = 0;
  for (std::uint64_t seed = 1; seed <= 20; ++seed) {
    MatchPlan plan = demo_plan();
    plan.seed = seed;
    ScenarioSetup s;
    s.players.push_back(placed(5, 50.0, 34.0));
    s.players.push_back(placed(6, 70.0, 34.0));
    s.players.push_back(standing(14, 60.0, 34.5));
    s.ball = BallOverride{};
    s.ball->owner = 5;
    s.only_listed_players = true;

    auto made = create_scenario_engine(plan, EngineConfig{}, s);
    MatchEngine& m = std::get<MatchEngine>(made);
    REQUIRE(apply_forced_pass(m, ForcedPass{5, 6}));
    m.step();
    const std::uint64_t kick = m.tick();
    for (int t = 0; t < 200 && !m.ball_owner(); ++t) m.step();
    REQUIRE(m.ball_owner().has_value());

    if (m.has_event(EventKind::Interception)) {
      const MatchEvent& e = m.events().back();
      REQUIRE(e.kind == EventKind::Interception);
      REQUIRE(e.player == 14);
      REQUIRE(e.other == 5);
      REQUIRE(e.tick > kick);
      REQUIRE(m.ball_owner() == 14);
      ++intercepted;
    } else {
      REQUIRE(m.ball_owner() == 6);
    }
  }
  // one try per pass at roughly even odds
  REQUIRE(intercepted > 0);
  REQUIRE(intercepted < 20);
}
