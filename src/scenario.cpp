#include <fmsim/scenario.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace fmsim {

static bool point_in_margin(const Vec2& p) {
  if (!p.finite()) return false;
  return p.x >= -kFieldMarginM && p.x <= kFieldLengthM + kFieldMarginM &&
         p.y >= -kFieldMarginM && p.y <= kFieldWidthM + kFieldMarginM;
}

static SetupError out_of_bounds(const std::string& what, const Vec2& p) {
  std::ostringstream os;
  os << what << " at (" << p.x << ", " << p.y << ") is outside the pitch";
  return SetupError{SetupErrorKind::ScenarioOutOfBounds, os.str()};
}

std::optional<SetupError> validate_scenario(const ScenarioSetup& s) {
  for (const auto& po : s.players) {
    if (po.idx < 0 || po.idx >= kPlayerCount) {
      return SetupError{SetupErrorKind::SlotOutOfRange, "scenario player index " + std::to_string(po.idx) + " out of range"};
    }
    if (po.pos_m && !point_in_margin(*po.pos_m)) return out_of_bounds("player " + std::to_string(po.idx), *po.pos_m);
    if (po.vel_mps && !po.vel_mps->finite()) {
      return SetupError{SetupErrorKind::ScenarioOutOfBounds, "player " + std::to_string(po.idx) + " velocity is not finite"};
    }
  }
  if (s.ball) {
    const BallOverride& b = *s.ball;
    if (!point_in_margin(b.pos_m)) return out_of_bounds("ball", b.pos_m);
    if (!std::isfinite(b.height_m) || b.height_m < 0.0 || b.height_m > kMaxBallHeightM) {
      return SetupError{SetupErrorKind::ScenarioOutOfBounds, "ball height out of range"};
    }
    if (!b.vel_mps.finite() || !std::isfinite(b.vz_mps)) {
      return SetupError{SetupErrorKind::ScenarioOutOfBounds, "ball velocity is not finite"};
    }
    if (b.owner && (*b.owner < 0 || *b.owner >= kPlayerCount)) {
      return SetupError{SetupErrorKind::SlotOutOfRange, "ball owner out of range"};
    }
  }
  return std::nullopt;
}

std::variant<MatchEngine, SetupError> create_scenario_engine(const MatchPlan& plan,
                                                             const EngineConfig& cfg,
                                                             const ScenarioSetup& setup,
                                                             log::Logger* logger) {
  if (auto err = validate_scenario(setup)) {
    if (logger) logger->warn("scenario rejected: {}", err->message);
    return *err;
  }
  auto made = create_match_engine(plan, cfg, logger);
  if (std::holds_alternative<SetupError>(made)) return made;
  MatchEngine& engine = std::get<MatchEngine>(made);

  if (setup.only_listed_players) {
    for (PlayerIndex i = 0; i < kPlayerCount; ++i) {
      const bool listed = std::any_of(setup.players.begin(), setup.players.end(),
                                      [&](const PlayerOverride& po) { return po.idx == i; });
      if (!listed) engine.remove_player(i);
    }
  }
  for (const auto& po : setup.players) {
    if (po.remove) {
      engine.remove_player(po.idx);
      continue;
    }
    if (po.pos_m) engine.set_player_position(po.idx, Coord10::from_vec(*po.pos_m));
    if (po.vel_mps) engine.set_player_velocity(po.idx, *po.vel_mps);
    engine.set_player_scripted(po.idx, po.scripted);
  }
  if (setup.ball) {
    const BallOverride& b = *setup.ball;
    engine.set_ball_state(Coord10::from_vec(b.pos_m, b.height_m), b.vel_mps, b.vz_mps, b.owner);
  }
  if (logger) logger->debug("scenario applied: {} player overrides", setup.players.size());
  return made;
}

bool apply_forced_pass(MatchEngine& engine, const ForcedPass& fp) {
  return engine.force_pass(fp.from, fp.to);
}

bool apply_forced_restart(MatchEngine& engine, const ForcedRestart& fr) {
  if (!point_in_margin(fr.spot_m)) return false;
  return engine.force_out_of_play(fr.kind, fr.team, Coord10::from_vec(fr.spot_m));
}

static const char* side_name(TeamSide s) { return s == TeamSide::Home ? "home" : "away"; }

std::vector<std::string> check_expectations(const MatchEngine& engine, const ScenarioExpectations& ex) {
  std::vector<std::string> out;

  for (const auto& e : ex.events) {
    const std::size_t n = engine.event_count(e.kind, e.team);
    std::ostringstream os;
    os << to_string(e.kind);
    if (e.team) os << " (" << side_name(*e.team) << ")";
    if (n < e.min_count) {
      os << ": expected at least " << e.min_count << ", got " << n;
      out.push_back(os.str());
    } else if (e.max_count && n > *e.max_count) {
      os << ": expected at most " << *e.max_count << ", got " << n;
      out.push_back(os.str());
    }
  }

  if (ex.score && !(engine.score() == *ex.score)) {
    std::ostringstream os;
    os << "score: expected " << ex.score->home << "-" << ex.score->away << ", got "
       << engine.score().home << "-" << engine.score().away;
    out.push_back(os.str());
  }

  if (ex.ball_owner) {
    const auto want = *ex.ball_owner;
    const auto got = engine.ball_owner();
    if (want != got) {
      std::ostringstream os;
      os << "ball owner: expected " << (want ? std::to_string(*want) : std::string("none")) << ", got "
         << (got ? std::to_string(*got) : std::string("none"));
      out.push_back(os.str());
    }
  }

  if (ex.ball_pos_m) {
    const Vec2 got = engine.ball().pos.to_vec();
    const double d = distance(got, *ex.ball_pos_m);
    if (!(d <= ex.ball_pos_tolerance_m)) {
      std::ostringstream os;
      os << "ball position: expected (" << ex.ball_pos_m->x << ", " << ex.ball_pos_m->y << "), got ("
         << got.x << ", " << got.y << "), off by " << d << " m";
      out.push_back(os.str());
    }
  }
  return out;
}

} // namespace fmsim
