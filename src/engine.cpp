#include <fmsim/engine.hpp>
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <utility>
#include <fmsim/steering.hpp>
#include <fmsim/target_position.hpp>

namespace fmsim {

namespace {
constexpr double kShotRangeM        = 25.0;
constexpr double kShotAimHeightM    = 1.2;
constexpr double kLongPassM         = 30.0;
constexpr double kPassArrivalMps    = 4.0;
constexpr double kPassMinM          = 5.0;
constexpr double kPassMaxM          = 40.0;
constexpr double kArriveSlowingM    = 3.0;
constexpr double kChaseLookaheadS   = 1.0;
constexpr double kPressureRadiusM   = 5.0;
constexpr int    kHeavyTouchDelay   = 6;
constexpr int    kLooseTouchCooldown = 3;
constexpr double kMinShotQuality    = 0.05;
constexpr double kShotLaneM         = 1.0;
constexpr double kBlockReachM       = 1.2;
constexpr double kBlockMaxHeightM   = 2.0;
constexpr double kKeeperMaxReachM   = 5.0;
constexpr double kInterceptLaneM    = 3.0;
constexpr double kInterceptReachM   = 2.0;
constexpr double kInterceptMinAlongM = 2.0;
constexpr double kInterceptMaxChance = 0.7;
constexpr double kPassDeadMps       = 2.0;
constexpr int    kPassLiveTicks     = 80;

GkSkills gk_skills(const PlayerAttributes& a) {
  return GkSkills{a.decisions, a.positioning, a.anticipation, a.bravery, a.pace, a.acceleration, a.agility};
}

double distance_to_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
  const Vec2 ab = b - a;
  const double len2 = ab.length_sq();
  if (len2 < 1e-9) return distance(p, a);
  const double t = std::clamp(((p.x - a.x) * ab.x + (p.y - a.y) * ab.y) / len2, 0.0, 1.0);
  return distance(p, a + ab * t);
}

// How far along a->b the projection of p lies, in meters.
double along_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
  const Vec2 ab = b - a;
  const double len = ab.length();
  if (len < 1e-6) return 0.0;
  return ((p.x - a.x) * ab.x + (p.y - a.y) * ab.y) / len;
}

// Scoring chance of an unhindered shot from d meters.
double distance_xg(double d) {
  return std::clamp(0.85 * std::exp(-0.12 * d), 0.01, 0.85);
}

// Which foot side the target lies on, seen from a player facing the attack.
BodySide side_for(const DirectionContext& dir, const Vec2& from, const Vec2& to) {
  const Vec2 fwd = dir.attack_direction();
  const Vec2 d = to - from;
  return fwd.x * d.y - fwd.y * d.x > 0.0 ? BodySide::Left : BodySide::Right;
}

// Resting spot beside the halfway line for players no longer on the pitch.
Coord10 touchline_spot(PlayerIndex idx) {
  const double side = team_of(idx) == TeamSide::Home ? -1.0 : 1.0;
  return Coord10::from_meters(kFieldLengthM * 0.5 + side * (2.0 + slot_of(idx) * 0.7), -0.5);
}
} // namespace

double PlayerState::top_speed_mps() const {
  const double base = 5.5 + std::clamp(attr.pace, 0.0, 100.0) / 100.0 * 3.5;
  return base * (0.7 + 0.3 * std::clamp(stamina, 0.0, 1.0));
}

const char* to_string(RestartKind k) {
  switch (k) {
    case RestartKind::KickOff:  return "kickoff";
    case RestartKind::ThrowIn:  return "throw_in";
    case RestartKind::GoalKick: return "goal_kick";
    case RestartKind::Corner:   return "corner";
    case RestartKind::FreeKick: return "free_kick";
  }
  return "?";
}

std::variant<MatchEngine, SetupError> create_match_engine(const MatchPlan& plan,
                                                          const EngineConfig& cfg,
                                                          log::Logger* logger) {
  if (auto msg = validate_config(cfg)) {
    SetupError err{SetupErrorKind::InvalidConfig, *msg};
    if (logger) logger->warn("match setup rejected: {}", err.message);
    return err;
  }
  if (auto err = validate_match_plan(plan)) {
    if (logger) logger->warn("match setup rejected ({}): {}", to_string(err->kind), err->message);
    return *err;
  }
  return MatchEngine(plan, cfg, logger);
}

std::variant<MatchResult, SetupError> simulate_match(const MatchPlan& plan,
                                                     const EngineConfig& cfg,
                                                     log::Logger* logger) {
  auto made = create_match_engine(plan, cfg, logger);
  if (auto* err = std::get_if<SetupError>(&made)) return *err;
  MatchEngine& engine = std::get<MatchEngine>(made);
  engine.run_to_end();
  return engine.result();
}

MatchEngine::MatchEngine(const MatchPlan& plan, const EngineConfig& cfg, log::Logger* logger)
  : cfg_(cfg),
    log_(logger),
    seed_(plan.seed),
    rng_(plan.seed),
    error_model_(cfg.concentration_modifier),
    decision_quality_(decision_quality_for(plan.difficulty)) {
  const TeamSpec* specs[2] = {&plan.home, &plan.away};
  for (int t = 0; t < 2; ++t) {
    const TeamSide side = t == 0 ? TeamSide::Home : TeamSide::Away;
    TeamState& ts = teams_[t];
    ts.side = side;
    ts.name = specs[t]->name;
    if (auto f = formation_by_key(specs[t]->formation)) ts.formation = *f;
    ts.instructions = specs[t]->instructions;
    ts.dir = DirectionContext::for_team(side);

    for (std::size_t i = 0; i < specs[t]->starters.size() && i < 11; ++i) {
      const PlayerSpec& ps = specs[t]->starters[i];
      const int slot = ps.slot >= 0 ? ps.slot : static_cast<int>(i);
      PlayerState& p = players_[player_index(side, slot)];
      p.idx = player_index(side, slot);
      p.name = ps.name;
      p.position = ts.formation.slots[slot].key;
      p.role = role_of(p.position);
      p.foot = ps.foot;
      p.attr = ps.attr;
      p.stamina = ps.stamina;
      p.is_user = plan.user_player && *plan.user_player == p.idx;
    }
  }

  log_info("kickoff: {} ({}) vs {} ({}), seed {}", teams_[0].name, teams_[0].formation.key,
           teams_[1].name, teams_[1].formation.key, seed_);
  kickoff(TeamSide::Home);
  if (cfg_.record_trace) {
    trace_.emplace();
    record_frame();
  }
}

// ---------------------------------------------------------------- stepping

bool MatchEngine::step() {
  if (finished_) return false;
  tick_ += 1;

  const int interval = std::max(1, cfg_.decision_interval_ticks);
  if (tick_ % static_cast<std::uint64_t>(interval) == 0) {
    update_tactics();
    decide_for_owner();
  }
  execute_due_actions();
  move_players();

  if (!ball_.is_owned()) step_ball_tick(ball_, cfg_.ball, cfg_.tick_seconds, cfg_.substeps);
  sanitize_ball(ball_);

  if (!try_block_shot()) check_keeper_save();
  if (!check_goal_or_out() && !try_intercept_pass()) resolve_ball_ownership();

  stats_.possession_tick(possession_team());
  if (trace_) record_frame();

  const auto half_ticks = static_cast<std::uint64_t>(cfg_.ticks_per_half());
  if (half_ == 1 && tick_ >= half_ticks) {
    half_time();
  } else if (half_ == 2 && tick_ >= 2 * half_ticks) {
    emit(EventKind::FullTime, TeamSide::Home);
    finished_ = true;
    log_info("full time: {} {}-{} {}", teams_[0].name, score_.home, score_.away, teams_[1].name);
  }
  return !finished_;
}

void MatchEngine::run_to_end() {
  while (step()) {}
}

int MatchEngine::run_ticks(int n) {
  int ran = 0;
  while (ran < n && !finished_) {
    step();
    ++ran;
  }
  return ran;
}

int MatchEngine::minute() const {
  const int total = cfg_.total_ticks();
  if (total <= 0) return 0;
  return static_cast<int>(std::min<std::uint64_t>(tick_ * 90 / static_cast<std::uint64_t>(total), 90));
}

// ---------------------------------------------------------------- match flow

void MatchEngine::kickoff(TeamSide side) {
  actions_.clear();
  pass_.reset();
  shot_.reset();
  cooldown_player_.reset();
  touch_delay_until_.fill(0);

  for (auto& ts : teams_) ts.gk_state = GkState::Attentive;
  for (auto& p : players_) {
    if (!p.active()) continue;
    const TeamState& ts = team(p.team());
    NormPos spot = ts.formation.slots[p.slot()].wp.base;
    spot.length = std::min(spot.length * 0.5, 0.46);   // own half
    p.pos = ts.dir.from_team_view(spot).clamped_in_bounds();
    p.vel = {};
  }

  // The most advanced outfield slot takes the kickoff.
  std::optional<PlayerIndex> kicker;
  double best = -1.0;
  const Formation& f = team(side).formation;
  for (int s = 0; s < 11; ++s) {
    const PlayerState& p = players_[player_index(side, s)];
    if (!p.active() || p.role == PositionRole::Goalkeeper) continue;
    if (f.slots[s].wp.base.length > best) {
      best = f.slots[s].wp.base.length;
      kicker = p.idx;
    }
  }

  const Coord10 centre = Coord10::center();
  if (kicker) {
    players_[*kicker].pos = centre;
    place_ball(ball_, centre, kicker);
    last_touch_ = kicker;
    restart_ = PendingRestart{RestartKind::KickOff, *kicker};
    stats_.touch(*kicker);
  } else {
    place_ball(ball_, centre);
    last_touch_.reset();
    restart_.reset();
  }
  protect_until_ = tick_ + static_cast<std::uint64_t>(cfg_.possession_protect_ticks);

  emit(EventKind::KickOff, side, kicker);
  update_tactics();
}

void MatchEngine::half_time() {
  emit(EventKind::HalfTime, TeamSide::Home);
  log_info("half time: {} {}-{} {}", teams_[0].name, score_.home, score_.away, teams_[1].name);
  half_ = 2;
  for (auto& ts : teams_) {
    ts.dir.swap_for_second_half();
    ts.line = DefensiveLine{};
  }
  for (auto& p : players_) p.stamina = std::min(1.0, p.stamina + 0.1);
  kickoff(TeamSide::Away);
}

void MatchEngine::award_restart(RestartKind kind, TeamSide side, const Coord10& spot) {
  if (kind == RestartKind::KickOff) {
    kickoff(side);
    return;
  }
  actions_.clear();
  pass_.reset();
  shot_.reset();
  cooldown_player_.reset();

  std::optional<PlayerIndex> taker;
  const PlayerIndex keeper = player_index(side, 0);
  if (kind == RestartKind::GoalKick && players_[keeper].active()) {
    taker = keeper;
  } else {
    const bool outfield = kind == RestartKind::ThrowIn || kind == RestartKind::Corner;
    taker = nearest_player(side, spot, outfield);
    if (!taker) taker = nearest_player(side, spot, false);
  }

  EventKind ev = EventKind::ThrowIn;
  switch (kind) {
    case RestartKind::ThrowIn:  ev = EventKind::ThrowIn; break;
    case RestartKind::GoalKick: ev = EventKind::GoalKick; break;
    case RestartKind::Corner:   ev = EventKind::Corner; break;
    case RestartKind::FreeKick:
    case RestartKind::KickOff:  break;
  }

  if (!taker) {
    place_ball(ball_, spot);
    restart_.reset();
  } else {
    PlayerState& p = players_[*taker];
    p.pos = Coord10{spot.x, spot.y, 0}.clamped_in_bounds();
    p.vel = {};
    place_ball(ball_, p.pos, *taker);
    last_touch_ = taker;
    restart_ = PendingRestart{kind, *taker};
    stats_.touch(*taker);
  }
  protect_until_ = tick_ + static_cast<std::uint64_t>(cfg_.possession_protect_ticks);
  if (kind != RestartKind::FreeKick) emit(ev, side, taker);
}

bool MatchEngine::check_goal_or_out() {
  if (ball_.is_owned()) return false;
  const double x = ball_.pos.length_m();
  const double y = ball_.pos.width_m();
  const bool over_goal_line = x < 0.0 || x > kFieldLengthM;
  const bool over_touchline = y < 0.0 || y > kFieldWidthM;
  if (!over_goal_line && !over_touchline) return false;

  std::optional<TeamSide> touched = possession_team();
  if (last_touch_) touched = team_of(*last_touch_);

  if (over_goal_line) {
    const double end = x < 0.0 ? 0.0 : kFieldLengthM;
    const TeamSide attackers = team(TeamSide::Home).dir.attack_goal_length_m() == end ? TeamSide::Home : TeamSide::Away;
    const TeamSide defenders = opponent_of(attackers);
    const bool between_posts = std::abs(y - kFieldWidthM * 0.5) < kGoalWidthM * 0.5;
    if (between_posts && ball_.height_m() < kGoalHeightM) {
      score_goal(attackers);
      return true;
    }
    if (touched && *touched == attackers) {
      const DirectionContext& d = team(defenders).dir;
      award_restart(RestartKind::GoalKick, defenders, d.forward_offset(d.own_goal_center(), 5.5));
    } else {
      award_restart(RestartKind::Corner, attackers, Coord10::from_meters(end, y < kFieldWidthM * 0.5 ? 0.0 : kFieldWidthM));
    }
    return true;
  }

  const TeamSide thrower = touched ? opponent_of(*touched) : TeamSide::Home;
  const Coord10 spot = Coord10::from_meters(std::clamp(x, 0.5, kFieldLengthM - 0.5), y < 0.0 ? 0.0 : kFieldWidthM);
  award_restart(RestartKind::ThrowIn, thrower, spot);
  return true;
}

void MatchEngine::score_goal(TeamSide scorers) {
  if (shot_ && team_of(shot_->shooter) == scorers) emit(EventKind::ShotOnTarget, scorers, shot_->shooter);
  if (scorers == TeamSide::Home) ++score_.home;
  else ++score_.away;
  emit(EventKind::Goal, scorers, last_touch_);
  log_info("goal {} ({}'): {} {}-{} {}", team(scorers).name, minute(), teams_[0].name, score_.home,
           score_.away, teams_[1].name);
  kickoff(opponent_of(scorers));
}

bool MatchEngine::try_block_shot() {
  if (!shot_ || ball_.is_owned() || ball_.height_m() > kBlockMaxHeightM) return false;
  const TeamSide defending = opponent_of(team_of(shot_->shooter));
  for (int s = 0; s < kPlayersPerTeam; ++s) {
    const PlayerIndex idx = player_index(defending, s);
    const PlayerState& q = players_[idx];
    if (!q.active() || q.role == PositionRole::Goalkeeper || shot_->tried[idx]) continue;
    if (q.pos.distance_to_m(ball_.pos) > kBlockReachM) continue;
    shot_->tried[idx] = true;
    const double chance = std::clamp(0.2 + q.attr.positioning / 100.0 * 0.2 + q.attr.bravery / 100.0 * 0.15, 0.0, 0.6);
    if (uniform() >= chance) continue;

    const Vec2 v = ball_.vel.to_mps();
    const double side = uniform() < 0.5 ? -1.0 : 1.0;
    launch_ball(ball_, v * -0.25 + v.perpendicular() * (0.3 * side), 2.0);
    ball_.previous_owner = idx;
    last_touch_ = idx;
    shot_.reset();
    diag_.increment("shot_blocked");
    log_debug("tick {}: shot blocked by {}", tick_, q.name);
    return true;
  }
  return false;
}

void MatchEngine::check_keeper_save() {
  if (!shot_ || shot_->save_attempted || ball_.is_owned()) return;
  const TeamSide defending = opponent_of(team_of(shot_->shooter));
  const PlayerIndex k = player_index(defending, 0);
  const PlayerState& gk = players_[k];
  if (!gk.active() || gk.role != PositionRole::Goalkeeper) return;
  if (ball_.height_m() > cfg_.gk_catch_max_m) return;

  // The keeper acts once the ball reaches their depth or comes close.
  const DirectionContext& own = team(defending).dir;
  const double ball_depth = own.forward_progress_m(ball_.pos);
  const double keeper_depth = own.forward_progress_m(gk.pos);
  if (ball_depth > keeper_depth + 1.0 && gk.pos.distance_to_m(ball_.pos) > 2.0) return;
  shot_->save_attempted = true;
  if (!shot_->on_target) {
    diag_.increment("save_left_wide");
    return;
  }

  const double speed = ball_.speed_mps();
  const double agility = std::clamp(gk.attr.agility, 0.0, 100.0) / 100.0;
  const double reflexes = std::clamp(gk.attr.reflexes, 0.0, 100.0) / 100.0;
  const double handling = std::clamp(gk.attr.handling, 0.0, 100.0) / 100.0;
  const double elapsed = double(tick_ - shot_->launched) * cfg_.tick_seconds;
  // distance the keeper must cover to meet the ball before it crosses the line
  const double gap = distance_to_segment(gk.pos.to_vec(), ball_.pos.to_vec(), shot_->crossing.to_vec());
  const double reach = std::min(kKeeperMaxReachM, 1.0 + (agility + reflexes) * 0.75 + elapsed * (2.0 + agility * 2.0));
  if (gap > reach) {
    diag_.increment("save_out_of_reach");
    return;
  }
  const double p = std::clamp(0.55 + (reflexes + handling) * 0.2 - std::max(0.0, speed - 20.0) * 0.015
                                  - gap / reach * 0.35 + elapsed * 0.1,
                              0.1, 0.95);
  if (uniform() >= p) {
    diag_.increment("save_missed");
    return;
  }

  const PlayerIndex shooter = shot_->shooter;
  emit(EventKind::ShotOnTarget, team_of(shooter), shooter);
  emit(EventKind::Save, defending, k, shooter);
  shot_.reset();
  pass_.reset();
  last_touch_ = k;

  if (speed < 22.0 && uniform() < handling) {
    diag_.increment("save_caught");
    take_possession(k);
    return;
  }
  // parried toward the nearer touchline
  diag_.increment("save_parried");
  const double side = ball_.pos.width_m() < kFieldWidthM * 0.5 ? -1.0 : 1.0;
  const Vec2 out = own.attack_direction() * (speed * 0.2) + along_width(side * speed * 0.35);
  launch_ball(ball_, out, 1.5);
  ball_.previous_owner = k;
  cooldown_player_ = k;
  cooldown_until_ = tick_ + static_cast<std::uint64_t>(cfg_.kick_cooldown_ticks);
}

// ---------------------------------------------------------------- decisions

void MatchEngine::update_tactics() {
  const auto poss = possession_team();
  for (TeamState& ts : teams_) {
    const TeamSide side = ts.side;
    const bool has_ball = poss && *poss == side;

    std::vector<Coord10> defenders;
    std::vector<Coord10> attackers;
    double teamwork = 0.0, concentration = 0.0;
    for (const auto& p : players_) {
      if (!p.active()) continue;
      if (p.team() == side && p.role == PositionRole::Defender) {
        defenders.push_back(p.pos);
        teamwork += p.attr.teamwork;
        concentration += p.attr.concentration;
      } else if (p.team() != side && p.role != PositionRole::Goalkeeper) {
        attackers.push_back(p.pos);
      }
    }
    if (!defenders.empty()) {
      teamwork /= double(defenders.size());
      concentration /= double(defenders.size());
    }
    update_defensive_line(ts.line, ts.dir, defenders, attackers, ball_.pos, teamwork, concentration,
                          ts.instructions.offside_trap, tick_);

    const PlayerState& keeper = players_[player_index(side, 0)];
    if (keeper.active() && keeper.role == PositionRole::Goalkeeper) {
      const GkState next = next_gk_state(ts.gk_state, sweeping_context(side), gk_skills(keeper.attr));
      if (next != ts.gk_state) diag_.increment(std::string("gk_") + to_string(next));
      ts.gk_state = next;
    }

    // Closest players first so the press quota goes to them.
    std::vector<std::pair<double, PlayerIndex>> order;
    for (int s = 0; s < 11; ++s) {
      const PlayerState& p = players_[player_index(side, s)];
      if (!p.active() || p.role == PositionRole::Goalkeeper || ball_.current_owner == p.idx) continue;
      order.emplace_back(p.pos.distance_to_m(ball_.pos), p.idx);
    }
    std::sort(order.begin(), order.end());

    const int cap = std::max(1, static_cast<int>(std::lround(cfg_.max_pressers * (0.5 + ts.instructions.pressing))));
    int pressers = 0;
    for (const auto& [dist, idx] : order) {
      PlayerState& p = players_[idx];
      const GoalAttributes ga = goal_attributes(p.attr);
      if (has_ball) {
        p.goal = TacticalGoal::attack(select_offensive_goal(score_offensive_goals(p.position, ga, p.is_user)));
        continue;
      }
      const GoalWeights scores = score_defensive_goals(p.position, ga, dist);
      DefensiveGoal g = select_defensive_goal(scores);
      if (g == DefensiveGoal::PressOpponent) {
        if (pressers < cap) ++pressers;
        else g = select_defensive_goal_without_press(scores);
      }
      p.goal = TacticalGoal::defend(g);
    }
  }
}

void MatchEngine::decide_for_owner() {
  if (!ball_.current_owner) return;
  const PlayerIndex o = *ball_.current_owner;
  const PlayerState& me = players_[o];
  if (!me.active() || me.scripted || actions_.has_active(o) || tick_ < touch_delay_until_[o]) return;

  const std::uint64_t t = tick_;
  const TeamSide side = me.team();
  const DirectionContext& dir = team(side).dir;

  auto pass_to = [&](PlayerIndex r) {
    ActionPayload pl;
    pl.receiver = r;
    actions_.schedule(ScheduledKind::Pass, o, t, t + 1, players_[r].pos, pl);
  };

  if (restart_ && restart_->taker == o) {
    const RestartKind kind = restart_->kind;
    restart_.reset();
    if (kind == RestartKind::Corner) {
      actions_.schedule(ScheduledKind::Cross, o, t, t + 2, cross_target(side));
    } else if (auto r = choose_receiver(o, false)) {
      pass_to(*r);
    } else if (auto n = nearest_player(side, me.pos, true, o)) {
      pass_to(*n);
    }
    return;
  }

  if (me.role == PositionRole::Goalkeeper) {
    if (auto r = choose_receiver(o, false)) pass_to(*r);
    else if (auto n = nearest_player(side, me.pos, true, o)) pass_to(*n);
    return;
  }

  const double dist_goal = dir.distance_to_attack_goal_m(me.pos);
  const NormPos view = dir.to_team_view(me.pos);
  const double pressure = pressure_on(o);
  const double u = uniform();

  if (dist_goal < kShotRangeM && dir.in_attacking_third(me.pos) && std::abs(view.width - 0.5) < 0.3) {
    const double quality = shot_quality(o);
    if (quality >= kMinShotQuality) {
      // shoot unless a teammate is better placed
      const double selfishness = 0.8 + std::clamp(me.attr.finishing, 0.0, 100.0) / 100.0 * 0.4;
      const auto r = choose_receiver(o, false);
      const double via_pass = r ? pass_value(o, *r) : 0.0;
      if (quality * selfishness > via_pass) {
        if (u < std::min(0.6, quality * 3.0)) {
          actions_.schedule(ScheduledKind::Shot, o, t, t + 2, dir.attack_goal_center());
          return;
        }
      } else if (r) {
        pass_to(*r);
        return;
      }
    }
  }
  if (dir.in_attacking_third(me.pos) && (view.width < 0.18 || view.width > 0.82) && u < 0.6) {
    actions_.schedule(ScheduledKind::Cross, o, t, t + 2, cross_target(side));
    return;
  }
  if (pressure > 0.45 || u < 0.2 + me.attr.vision / 500.0) {
    const bool allow_offside = uniform() < (100.0 - me.attr.decisions) / 300.0;
    if (auto r = choose_receiver(o, allow_offside)) {
      pass_to(*r);
      return;
    }
  }
  actions_.schedule(ScheduledKind::Dribble, o, t, t + static_cast<std::uint64_t>(std::max(1, cfg_.decision_interval_ticks)),
                    dribble_target(o));
}

std::optional<PlayerIndex> MatchEngine::choose_receiver(PlayerIndex owner, bool allow_offside) {
  const PlayerState& me = players_[owner];
  const DirectionContext& dir = team(me.team()).dir;
  const double my_progress = dir.forward_progress_m(me.pos);

  std::optional<PlayerIndex> best;
  double best_score = -std::numeric_limits<double>::infinity();
  for (int s = 0; s < 11; ++s) {
    const PlayerIndex idx = player_index(me.team(), s);
    const PlayerState& p = players_[idx];
    if (idx == owner || !p.active() || p.role == PositionRole::Goalkeeper) continue;
    const double d = me.pos.distance_to_m(p.pos);
    if (d < kPassMinM || d > kPassMaxM) continue;
    if (!allow_offside && in_offside_position(idx)) continue;

    double open = 10.0;
    int blockers = 0;
    for (const auto& q : players_) {
      if (!q.active() || q.team() == me.team()) continue;
      open = std::min(open, q.pos.distance_to_m(p.pos));
      if (distance_to_segment(q.pos.to_vec(), me.pos.to_vec(), p.pos.to_vec()) < 2.0) ++blockers;
    }
    const double gain = dir.forward_progress_m(p.pos) - my_progress;
    const double score = gain * 0.5 + open - d * 0.1 - blockers * 8.0;
    if (score > best_score) {
      best_score = score;
      best = idx;
    }
  }
  return best;
}

double MatchEngine::shot_quality(PlayerIndex shooter) const {
  const PlayerState& me = players_[shooter];
  const DirectionContext& dir = team(me.team()).dir;
  const double d = dir.distance_to_attack_goal_m(me.pos);
  const double skill = std::clamp(d < 18.0 ? me.attr.finishing : me.attr.long_shots, 0.0, 100.0);
  const double pressure = 1.0 - pressure_on(shooter) * 0.6;
  const double angle = std::abs(dir.to_team_view(me.pos).width - 0.5) < 0.15 ? 1.0 : 0.6;

  bool clear = true;
  const Vec2 from = me.pos.to_vec();
  const Vec2 goal = dir.attack_goal_center().to_vec();
  for (const auto& q : players_) {
    if (!q.active() || q.team() == me.team() || q.role == PositionRole::Goalkeeper) continue;
    if (distance_to_segment(q.pos.to_vec(), from, goal) < kShotLaneM) {
      clear = false;
      break;
    }
  }
  return distance_xg(d) * (0.6 + skill / 100.0 * 0.8) * pressure * angle * (clear ? 1.0 : 0.5);
}

// Scoring chance from the receiver's spot, discounted by the risk of the pass.
double MatchEngine::pass_value(PlayerIndex owner, PlayerIndex receiver) const {
  const PlayerState& me = players_[owner];
  const PlayerState& rc = players_[receiver];
  int blockers = 0;
  for (const auto& q : players_) {
    if (!q.active() || q.team() == me.team()) continue;
    if (distance_to_segment(q.pos.to_vec(), me.pos.to_vec(), rc.pos.to_vec()) < 2.0) ++blockers;
  }
  const double completion = std::clamp(0.85 - blockers * 0.25, 0.1, 0.85);
  return distance_xg(team(rc.team()).dir.distance_to_attack_goal_m(rc.pos)) * completion;
}

Coord10 MatchEngine::dribble_target(PlayerIndex owner) const {
  const PlayerState& me = players_[owner];
  const DirectionContext& dir = team(me.team()).dir;
  Vec2 heading = dir.attack_direction();
  heading += along_width((kFieldWidthM * 0.5 - me.pos.width_m()) / kFieldWidthM * 0.6);   // drift inside

  if (auto opp = nearest_player(opponent_of(me.team()), me.pos, false)) {
    const PlayerState& q = players_[*opp];
    if (me.pos.distance_to_m(q.pos) < 6.0) {
      heading += evade(me.pos.to_vec(), q.pos.to_vec(), q.vel, 1.0, 0.5) * 0.6;
    }
  }
  heading = heading.normalized();
  if (heading.length_sq() < 1e-9) heading = dir.attack_direction();
  return Coord10::from_vec(me.pos.to_vec() + heading * 8.0).clamped_in_bounds();
}

Coord10 MatchEngine::cross_target(TeamSide side) {
  const DirectionContext& dir = team(side).dir;
  const double depth = 6.0 + uniform() * 6.0;
  const double lateral = (uniform() - 0.5) * 12.0;
  const Coord10 c = dir.forward_offset(dir.attack_goal_center(), -depth);
  return Coord10::from_vec(c.to_vec() + along_width(lateral)).clamped_in_bounds();
}

void MatchEngine::execute_due_actions() {
  for (const ScheduledAction& a : actions_.pop_due(tick_)) {
    if (ball_.current_owner != a.player) {
      diag_.increment("action_dropped");
      if (diag_.first_time("action_dropped")) log_debug("tick {}: {} by {} dropped, ball lost", tick_, to_string(a.kind), a.player);
      continue;
    }
    switch (a.kind) {
      case ScheduledKind::Pass:
        if (a.payload.receiver) execute_pass(a.player, *a.payload.receiver);
        break;
      case ScheduledKind::Shot:
        execute_shot(a.player);
        break;
      case ScheduledKind::Cross:
        execute_cross(a.player, a.target);
        break;
      case ScheduledKind::Dribble:
      case ScheduledKind::Tackle:
      case ScheduledKind::Save:
        break;
    }
  }
}

void MatchEngine::after_kick(PlayerIndex kicker) {
  last_touch_ = kicker;
  cooldown_player_ = kicker;
  cooldown_until_ = tick_ + static_cast<std::uint64_t>(cfg_.kick_cooldown_ticks);
  restart_.reset();
  shot_.reset();
  protect_until_ = 0;
}

void MatchEngine::execute_pass(PlayerIndex from, PlayerIndex to) {
  const PlayerState& me = players_[from];
  const PlayerState& rc = players_[to];
  const DirectionContext& dir = team(me.team()).dir;
  const Vec2 origin = me.pos.to_vec();
  const Vec2 intended = rc.pos.to_vec() + rc.vel * 0.5;

  ErrorContext ctx = error_context(me, me.attr.passing);
  ctx.weak_foot = is_weak_foot(me.foot, side_for(dir, origin, intended));
  const ExecutionError err = error_model_.sample(ActionKind::Pass, ctx, rng_);
  const Vec2 realized = Coord10::from_vec(apply_error_to_target(origin, intended, err)).clamped_to_field().to_vec();

  const double dist = distance(origin, realized);
  Vec2 heading = (realized - origin).normalized();
  if (heading.length_sq() < 1e-9) heading = dir.attack_direction();
  const bool offside = in_offside_position(to);

  if (dist > kLongPassM) {
    const double vz = vz_for_profile(HeightProfile::Arc, cfg_.ball.gravity);
    const double flight = 2.0 * vz / cfg_.ball.gravity;
    launch_ball(ball_, heading * std::min(30.0, dist / flight * 1.1), vz);
  } else {
    launch_ball(ball_, heading * solve_ground_pass_speed(dist, kPassArrivalMps, cfg_), 0.0);
  }
  emit(EventKind::Pass, me.team(), from, to);
  after_kick(from);
  PassInFlight pf;
  pf.passer = from;
  pf.receiver = to;
  pf.offside = offside;
  pf.from = Coord10::from_vec(origin);
  pf.to = Coord10::from_vec(realized);
  pf.launched = tick_;
  pass_ = pf;
}

void MatchEngine::execute_shot(PlayerIndex shooter) {
  const PlayerState& me = players_[shooter];
  const DirectionContext& dir = team(me.team()).dir;
  const Vec2 origin = me.pos.to_vec();
  const Coord10 goal = dir.attack_goal_center();
  const double post = (kGoalWidthM * 0.5 - 0.6) * (uniform() < 0.5 ? -1.0 : 1.0);
  const Vec2 intended = goal.to_vec() + along_width(post);

  const double skill = distance(origin, intended) > 20.0 ? me.attr.long_shots : me.attr.finishing;
  ErrorContext ctx = error_context(me, skill);
  ctx.weak_foot = is_weak_foot(me.foot, side_for(dir, origin, intended));
  const ExecutionError err = error_model_.sample(ActionKind::Shot, ctx, rng_);
  const Vec2 realized = apply_error_to_target(origin, intended, err);
  const double height = std::min(apply_error_to_height(kShotAimHeightM, err), 6.0);

  const Vec2 fwd = dir.attack_direction();
  Vec2 heading = (realized - origin).normalized();
  if (heading.length_sq() < 1e-9) heading = fwd;
  const double speed = (18.0 + skill / 100.0 * 10.0) * (1.0 - 0.25 * me.fatigue());
  const double flight = std::max(0.1, distance(origin, realized) / speed);
  const double vz = std::clamp(height / flight + 0.5 * cfg_.ball.gravity * flight, 0.0, 20.0);

  launch_ball(ball_, heading * speed, vz);
  emit(EventKind::Shot, me.team(), shooter);
  after_kick(shooter);
  pass_.reset();

  ShotInFlight sf;
  sf.shooter = shooter;
  sf.launched = tick_;
  sf.crossing = goal;
  // straight-line flight to the goal line, drag and curl ignored
  const double closing = (heading.x * fwd.x + heading.y * fwd.y) * speed;
  if (closing > 0.1) {
    const double t_line = (kFieldLengthM - dir.forward_progress_m(me.pos)) / closing;
    const Coord10 at_line = Coord10::from_vec(origin + heading * (speed * t_line));
    const double h = vz * t_line - 0.5 * cfg_.ball.gravity * t_line * t_line;
    sf.crossing = at_line;
    sf.on_target = std::abs(at_line.width_m() - kFieldWidthM * 0.5) < kGoalWidthM * 0.5 && h < kGoalHeightM;
  }
  shot_ = sf;
  log_debug("tick {}: shot by {} from {} m", tick_, me.name, distance(origin, intended));
}

void MatchEngine::execute_cross(PlayerIndex crosser, const Coord10& target) {
  const PlayerState& me = players_[crosser];
  const DirectionContext& dir = team(me.team()).dir;
  const Vec2 origin = me.pos.to_vec();

  ErrorContext ctx = error_context(me, me.attr.crossing);
  ctx.weak_foot = is_weak_foot(me.foot, side_for(dir, origin, target.to_vec()));
  const ExecutionError err = error_model_.sample(ActionKind::Cross, ctx, rng_);
  const Vec2 realized = apply_error_to_target(origin, target.to_vec(), err);

  Vec2 heading = (realized - origin).normalized();
  if (heading.length_sq() < 1e-9) heading = dir.attack_direction();
  const double vz = vz_for_profile(HeightProfile::Arc, cfg_.ball.gravity) * std::clamp(err.height_factor, 0.7, 1.3);
  const double flight = 2.0 * vz / cfg_.ball.gravity;
  const double speed = std::min(30.0, distance(origin, realized) / std::max(0.1, flight) * 1.15);

  // curl toward the goal line
  const Vec2 fwd = dir.attack_direction();
  const Vec2 perp = heading.perpendicular();
  const double curl = perp.x * fwd.x + perp.y * fwd.y >= 0.0 ? 1.0 : -1.0;
  launch_ball(ball_, heading * speed, vz, Vec2{0.0, 0.04 * curl}, 0.3 * curl);

  emit(EventKind::Cross, me.team(), crosser);
  after_kick(crosser);
  PassInFlight pf;
  pf.passer = crosser;
  pf.from = Coord10::from_vec(origin);
  pf.to = Coord10::from_vec(realized).clamped_to_field();
  pf.launched = tick_;
  pass_ = pf;
}

// ---------------------------------------------------------------- movement

SweepingContext MatchEngine::sweeping_context(TeamSide side) const {
  SweepingContext ctx;
  ctx.gk_pos = players_[player_index(side, 0)].pos;
  ctx.ball_pos = ball_.pos;
  ctx.ball_vel_mps = ball_.vel.to_mps();
  ctx.opponent_has_ball = ball_.current_owner && team_of(*ball_.current_owner) != side;
  if (auto o = nearest_player(opponent_of(side), ball_.pos, true)) ctx.nearest_opponent = players_[*o].pos;
  ctx.defending = team(side).dir;
  return ctx;
}

Coord10 MatchEngine::player_target(const PlayerState& p) const {
  const TeamState& ts = team(p.team());
  if (ball_.current_owner == p.idx) {
    const ScheduledAction* a = actions_.active_for(p.idx);
    if (a && a->kind == ScheduledKind::Dribble) return a->target;
    return p.pos;
  }

  TargetContext ctx;
  ctx.slot = p.slot();
  ctx.position = p.position;
  ctx.wp = ts.formation.slots[ctx.slot].wp;
  ctx.instructions = ts.instructions.players[ctx.slot];
  ctx.goal = p.goal;
  const auto poss = possession_team();
  ctx.team_has_possession = poss && *poss == p.team();
  ctx.ball = ts.dir.to_team_view(ball_.pos);
  for (int s = 0; s < 11; ++s) {
    const PlayerState& m = players_[player_index(p.team(), s)];
    ctx.teammates[s] = ts.dir.to_team_view(m.pos);
    ctx.active[s] = m.active();
    ctx.roles[s] = m.role;
  }
  ctx.minute = minute();
  ctx.score_diff = score_.diff_for(p.team());
  ctx.line = &ts.line;
  if (p.role == PositionRole::Goalkeeper) {
    ctx.gk_state = ts.gk_state;
    ctx.gk_target = ts.dir.to_team_view(gk_state_target(ts.gk_state, sweeping_context(p.team()), gk_skills(p.attr)));
  }
  return ts.dir.from_team_view(compute_target(ctx)).clamped_in_bounds();
}

void MatchEngine::move_players() {
  const double dt = cfg_.tick_seconds;

  // Loose ball: the pass receiver, else the nearest outfield player, chases it.
  std::array<std::optional<PlayerIndex>, 2> chasers{};
  if (!ball_.is_owned()) {
    for (int t = 0; t < 2; ++t) {
      const TeamSide side = t == 0 ? TeamSide::Home : TeamSide::Away;
      if (pass_ && pass_->receiver && team_of(pass_->passer) == side && players_[*pass_->receiver].active()) {
        chasers[t] = pass_->receiver;
        continue;
      }
      std::optional<PlayerIndex> skip;
      if (cooldown_player_ && tick_ < cooldown_until_) skip = cooldown_player_;
      chasers[t] = nearest_player(side, ball_.pos, true, skip);
    }
  }
  const PlayerState* carrier = ball_.current_owner ? &players_[*ball_.current_owner] : nullptr;

  for (auto& p : players_) {
    if (!p.active()) continue;
    const Coord10 before = p.pos;

    if (p.scripted) {
      p.pos = Coord10::from_vec(p.pos.to_vec() + p.vel * dt).clamped_in_bounds();
    } else {
      double top = p.top_speed_mps();
      if (carrier == &p) top *= 0.75 + p.attr.dribbling / 100.0 * 0.15;

      Vec2 desired;
      if (chasers[static_cast<int>(p.team())] == p.idx) {
        desired = pursuit(p.pos.to_vec(), ball_.pos.to_vec(), ball_.vel.to_mps(), top, kChaseLookaheadS);
      } else if (carrier && carrier->team() != p.team() && !p.goal.offensive &&
                 p.goal.def == DefensiveGoal::PressOpponent) {
        desired = pursuit(p.pos.to_vec(), carrier->pos.to_vec(), carrier->vel, top, kChaseLookaheadS);
      } else {
        desired = arrive(p.pos.to_vec(), player_target(p).to_vec(), top, kArriveSlowingM);
      }
      const double max_delta = (3.0 + p.attr.acceleration / 100.0 * 4.0) * dt;
      p.vel = sanitize(steer_toward(p.vel, desired, max_delta));
      p.pos = Coord10::from_vec(p.pos.to_vec() + p.vel * dt).clamped_in_bounds();
    }

    const double moved = before.distance_to_m(p.pos);
    stats_.distance(p.idx, moved);
    const double drain = moved * 0.00004 * (1.5 - std::clamp(p.attr.stamina, 0.0, 100.0) / 100.0);
    const double recover = p.vel.length() < 2.0 ? 0.00002 : 0.0;
    p.stamina = std::clamp(p.stamina - drain + recover, 0.2, 1.0);

    if (ball_.current_owner == p.idx) ball_.pos = Coord10{p.pos.x, p.pos.y, 0};
  }
}

// ---------------------------------------------------------------- ball control

bool MatchEngine::pass_live() const {
  if (!pass_ || ball_.is_owned()) return false;
  if (tick_ > pass_->launched + static_cast<std::uint64_t>(kPassLiveTicks)) return false;
  return ball_.is_airborne() || ball_.speed_mps() > kPassDeadMps;
}

bool MatchEngine::may_claim_ball(const PlayerState& p) const {
  if (!p.active()) return false;
  if (cooldown_player_ == p.idx && tick_ < cooldown_until_) return false;
  // no reclaiming one's own pass while it is still rolling
  if (pass_ && pass_->passer == p.idx && !ball_.is_stopped()) return false;
  if (pass_live()) {
    // a live pass is for the receiver (any teammate for a cross)
    if (team_of(p.idx) != team_of(pass_->passer)) return false;
    if (pass_->receiver && *pass_->receiver != p.idx) return false;
  }
  return true;
}

bool MatchEngine::try_intercept_pass() {
  if (!pass_live() || tick_ <= pass_->launched) return false;
  const TeamSide defending = opponent_of(team_of(pass_->passer));
  const Vec2 a = pass_->from.to_vec();
  const Vec2 b = pass_->to.to_vec();
  const double h = ball_.height_m();
  const double speed_factor = std::clamp(1.3 - ball_.speed_mps() / 20.0, 0.4, 1.0);

  // Each defender near the line gets one attempt per pass; the best success wins.
  std::optional<PlayerIndex> winner;
  double best = 0.0;
  for (int s = 0; s < kPlayersPerTeam; ++s) {
    const PlayerIndex idx = player_index(defending, s);
    const PlayerState& q = players_[idx];
    if (!q.active() || pass_->tried[idx]) continue;
    if (h > (q.role == PositionRole::Goalkeeper ? cfg_.gk_catch_max_m : cfg_.header_max_m)) continue;
    if (q.pos.distance_to_m(ball_.pos) > kInterceptReachM) continue;
    const Vec2 at = q.pos.to_vec();
    const double lane = distance_to_segment(at, a, b);
    if (lane >= kInterceptLaneM || along_segment(at, a, b) < kInterceptMinAlongM) continue;

    pass_->tried[idx] = true;
    const double read = (std::clamp(q.attr.anticipation, 0.0, 100.0) * 0.4 +
                         std::clamp(q.attr.positioning, 0.0, 100.0) * 0.3 +
                         std::clamp(q.attr.pace, 0.0, 100.0) * 0.3) / 100.0;
    const double chance = std::min(kInterceptMaxChance, read * (1.0 - lane / kInterceptLaneM) * speed_factor);
    if (uniform() < chance && (!winner || chance > best)) {
      winner = idx;
      best = chance;
    }
  }
  if (!winner) return false;

  const PlayerIndex passer = pass_->passer;
  diag_.increment("pass_intercepted");
  take_possession(*winner);
  emit(EventKind::Interception, team_of(*winner), *winner, passer);
  return true;
}

void MatchEngine::resolve_ball_ownership() {
  if (ball_.current_owner) {
    if (tick_ < protect_until_) return;
    const PlayerState& owner = players_[*ball_.current_owner];
    const bool contested = std::any_of(players_.begin(), players_.end(), [&](const PlayerState& q) {
      return q.active() && q.team() != owner.team() && q.pos.distance_to_m(owner.pos) <= cfg_.tackle_range_m;
    });
    if (!contested) return;
  } else if (ball_.speed_mps() > cfg_.max_controllable_speed) {
    diag_.increment("ball_too_fast");
    return;
  }

  std::vector<ContestPlayer> field;
  field.reserve(players_.size());
  for (const auto& p : players_) {
    if (!p.active()) continue;
    ContestPlayer c;
    c.idx = p.idx;
    c.pos = p.pos;
    c.tackling = p.attr.tackling;
    c.aggression = p.attr.aggression;
    c.bravery = p.attr.bravery;
    c.strength = p.attr.strength;
    c.agility = p.attr.agility;
    c.is_goalkeeper = p.role == PositionRole::Goalkeeper;
    c.is_hero = p.is_user;
    c.eligible = may_claim_ball(p);
    field.push_back(c);
  }

  const OwnershipDecision dec = resolve_ownership(ball_, field, OwnershipParams::from_config(cfg_));
  switch (dec.change) {
    case OwnershipChange::None:
    case OwnershipChange::Retained:
      return;
    case OwnershipChange::Pickup:
      take_possession(*dec.owner);
      return;
    case OwnershipChange::CrossTeamTransfer:
      handle_tackle(*dec.owner, *dec.from);
      return;
  }
}

void MatchEngine::take_possession(PlayerIndex idx) {
  if (ball_.current_owner) actions_.cancel_for(*ball_.current_owner);
  assign_ownership(ball_, idx, players_[idx].pos);
  stats_.touch(idx);
  last_touch_ = idx;
  shot_.reset();
  protect_until_ = tick_ + static_cast<std::uint64_t>(cfg_.possession_protect_ticks);

  if (!pass_) return;
  const PassInFlight pf = *pass_;
  pass_.reset();
  if (team_of(idx) != team_of(pf.passer)) return;   // dead pass picked up by the other side
  if (idx == pf.passer) return;
  if (pf.offside && pf.receiver == idx) {
    emit(EventKind::Offside, team_of(idx), idx, pf.passer);
    award_restart(RestartKind::FreeKick, opponent_of(team_of(idx)), players_[idx].pos);
    return;
  }
  if (pf.receiver) emit(EventKind::PassCompleted, team_of(idx), pf.passer, idx);
  first_touch(idx);
}

void MatchEngine::handle_tackle(PlayerIndex winner, PlayerIndex loser) {
  const TeamSide side = team_of(winner);
  emit(EventKind::Tackle, side, winner, loser);

  const double aggr = std::clamp(players_[winner].attr.aggression, 0.0, 100.0) / 100.0;
  if (uniform() < 0.03 + aggr * 0.07) {
    emit(EventKind::Foul, side, winner, loser);
    const double u = uniform();
    const double p_red = 0.005 + aggr * 0.01;
    const double p_yellow = 0.12 + aggr * 0.18;
    if (u < p_red) {
      emit(EventKind::RedCard, side, winner);
      send_off(winner);
    } else if (u < p_red + p_yellow) {
      emit(EventKind::YellowCard, side, winner);
      if (++players_[winner].yellow_cards >= 2) {
        emit(EventKind::RedCard, side, winner);
        send_off(winner);
      }
    }
    award_restart(RestartKind::FreeKick, team_of(loser), players_[loser].pos);
    return;
  }
  take_possession(winner);
}

void MatchEngine::first_touch(PlayerIndex receiver) {
  const PlayerState& p = players_[receiver];
  const ExecutionError err = error_model_.sample(ActionKind::FirstTouch, error_context(p, p.attr.first_touch), rng_);
  const double control = first_touch_control_distance(err);
  const TouchQuality q = classify_first_touch(control);
  diag_.increment(std::string("first_touch_") + to_string(q));

  if (q == TouchQuality::Heavy) {
    touch_delay_until_[receiver] = tick_ + kHeavyTouchDelay;
  } else if (q == TouchQuality::Loose) {
    const Vec2 away = team(p.team()).dir.attack_direction().rotated_deg(err.dir_angle_deg * 10.0);
    launch_ball(ball_, away * std::min(8.0, control * 2.0), 0.0);
    cooldown_player_ = receiver;
    cooldown_until_ = tick_ + kLooseTouchCooldown;
    protect_until_ = 0;
  }
}

void MatchEngine::send_off(PlayerIndex idx) {
  PlayerState& p = players_[idx];
  p.sent_off = true;
  p.vel = {};
  p.pos = touchline_spot(idx);
  actions_.cancel_for(idx);
  if (ball_.current_owner == idx) place_ball(ball_, ball_.pos);
  log_info("red card: {} ({})", p.name, team(p.team()).name);
}

// ---------------------------------------------------------------- helpers

ErrorContext MatchEngine::error_context(const PlayerState& p, double skill) const {
  ErrorContext c;
  c.skill = skill;
  c.composure = p.attr.composure;
  c.decisions = p.attr.decisions;
  c.concentration = p.attr.concentration;
  c.pressure = pressure_on(p.idx);
  c.fatigue = p.fatigue();
  c.decision_quality = p.is_user ? 1.0 : decision_quality_;
  return c;
}

double MatchEngine::pressure_on(PlayerIndex idx) const {
  const PlayerState& p = players_[idx];
  double nearest = std::numeric_limits<double>::max();
  for (const auto& q : players_) {
    if (!q.active() || q.team() == p.team()) continue;
    nearest = std::min(nearest, q.pos.distance_to_m(p.pos));
  }
  return std::clamp(1.0 - nearest / kPressureRadiusM, 0.0, 1.0);
}

std::optional<PlayerIndex> MatchEngine::nearest_player(TeamSide side, const Coord10& at, bool outfield_only,
                                                       std::optional<PlayerIndex> exclude) const {
  std::optional<PlayerIndex> best;
  double best_d = std::numeric_limits<double>::max();
  for (int s = 0; s < 11; ++s) {
    const PlayerState& p = players_[player_index(side, s)];
    if (!p.active() || (outfield_only && p.role == PositionRole::Goalkeeper) || exclude == p.idx) continue;
    const double d = p.pos.distance_to_m(at);
    if (d < best_d) {
      best_d = d;
      best = p.idx;
    }
  }
  return best;
}

double MatchEngine::second_last_defender_progress(TeamSide attacking) const {
  const DirectionContext& dir = team(attacking).dir;
  std::vector<double> prog;
  for (const auto& q : players_) {
    if (q.active() && q.team() != attacking) prog.push_back(dir.forward_progress_m(q.pos));
  }
  if (prog.size() < 2) return kFieldLengthM;
  std::sort(prog.begin(), prog.end(), std::greater<double>());
  return prog[1];
}

bool MatchEngine::in_offside_position(PlayerIndex idx) const {
  const PlayerState& p = players_[idx];
  const DirectionContext& dir = team(p.team()).dir;
  return would_be_offside(dir.forward_progress_m(p.pos), second_last_defender_progress(p.team()),
                          dir.forward_progress_m(ball_.pos));
}

double MatchEngine::uniform() {
  std::uniform_real_distribution<double> U(0.0, 1.0);
  return U(rng_);
}

void MatchEngine::emit(EventKind kind, TeamSide side, std::optional<PlayerIndex> player, std::optional<PlayerIndex> other) {
  MatchEvent e;
  e.tick = tick_;
  e.minute = minute();
  e.kind = kind;
  e.team = side;
  e.player = player;
  e.other = other;
  e.pos = ball_.pos;
  events_.push_back(e);
  stats_.record(e);
  log_debug("tick {}: {} {}", tick_, to_string(kind), team(side).name);
}

void MatchEngine::record_frame() {
  TickFrame f;
  f.tick = tick_;
  f.ball = ball_.pos;
  f.owner = ball_.current_owner;
  for (std::size_t i = 0; i < players_.size(); ++i) f.players[i] = players_[i].pos;
  trace_->frames.push_back(f);
}

// ---------------------------------------------------------------- accessors

std::optional<TeamSide> MatchEngine::possession_team() const {
  if (ball_.current_owner) return team_of(*ball_.current_owner);
  if (ball_.previous_owner) return team_of(*ball_.previous_owner);
  if (last_touch_) return team_of(*last_touch_);
  return std::nullopt;
}

const PlayerState* MatchEngine::player_by_index(PlayerIndex idx) const {
  if (idx < 0 || idx >= static_cast<PlayerIndex>(players_.size())) return nullptr;
  return &players_[idx];
}

bool MatchEngine::has_event(EventKind kind) const {
  return std::any_of(events_.begin(), events_.end(), [&](const MatchEvent& e) { return e.kind == kind; });
}

bool MatchEngine::has_event(std::string_view name) const {
  const auto kind = event_kind_from_string(name);
  return kind && has_event(*kind);
}

std::optional<double> MatchEngine::metric(std::string_view name) const {
  if (name == "ball_speed_mps") return ball_.speed_mps();
  if (name == "ball_height_m") return ball_.height_m();
  if (name == "ball_x_m") return ball_.pos.x_m();
  if (name == "ball_y_m") return ball_.pos.y_m();
  if (name == "ball_owner") {
    if (!ball_.current_owner) return std::nullopt;
    return double(*ball_.current_owner);
  }
  if (name == "possession_home") return stats().possession_share(TeamSide::Home);
  if (name == "possession_away") return stats().possession_share(TeamSide::Away);
  if (name == "home_goals") return double(score_.home);
  if (name == "away_goals") return double(score_.away);
  if (name == "home_shots") return double(stats().team(TeamSide::Home).shots);
  if (name == "away_shots") return double(stats().team(TeamSide::Away).shots);
  if (name == "tick") return double(tick_);
  if (name == "minute") return double(minute());
  if (name == "half") return double(half_);
  if (name == "events") return double(events_.size());
  return std::nullopt;
}

MatchResult MatchEngine::result() const {
  MatchResult r;
  r.home_name = teams_[0].name;
  r.away_name = teams_[1].name;
  r.seed = seed_;
  r.ticks_played = tick_;
  r.score = score_;
  r.events = events_;
  r.stats = stats_.stats();
  r.trace = trace_;
  return r;
}

// ---------------------------------------------------------------- scenario hooks

bool MatchEngine::set_player_position(PlayerIndex idx, const Coord10& pos) {
  if (!player_by_index(idx)) return false;
  PlayerState& p = players_[idx];
  p.pos = Coord10{pos.x, pos.y, 0}.clamped_in_bounds();
  if (ball_.current_owner == idx) ball_.pos = p.pos;
  return true;
}

bool MatchEngine::set_player_velocity(PlayerIndex idx, const Vec2& vel_mps) {
  if (!player_by_index(idx)) return false;
  players_[idx].vel = sanitize(vel_mps);
  return true;
}

bool MatchEngine::set_player_scripted(PlayerIndex idx, bool scripted) {
  if (!player_by_index(idx)) return false;
  players_[idx].scripted = scripted;
  return true;
}

bool MatchEngine::remove_player(PlayerIndex idx) {
  if (!player_by_index(idx)) return false;
  PlayerState& p = players_[idx];
  p.removed = true;
  p.vel = {};
  p.pos = touchline_spot(idx);
  actions_.cancel_for(idx);
  if (ball_.current_owner == idx) place_ball(ball_, ball_.pos);
  return true;
}

void MatchEngine::set_ball_state(const Coord10& pos, const Vec2& vel_mps, double vz_mps,
                                 std::optional<PlayerIndex> owner) {
  actions_.clear();
  pass_.reset();
  shot_.reset();
  restart_.reset();
  cooldown_player_.reset();
  protect_until_ = 0;

  if (owner && player_by_index(*owner) && players_[*owner].active()) {
    place_ball(ball_, players_[*owner].pos, owner);
    last_touch_ = owner;
    return;
  }
  ball_ = Ball{};
  ball_.pos = pos.clamped_to_field();
  ball_.vel = Vel10::from_mps(vel_mps);
  ball_.vz = std::isfinite(vz_mps) ? meters_to_units(vz_mps) : 0;
  ball_.phase = (ball_.pos.z > 0 || ball_.vz > 0) ? BallPhase::Airborne : BallPhase::Rolling;
  sanitize_ball(ball_);
  last_touch_.reset();
}

bool MatchEngine::force_pass(PlayerIndex from, PlayerIndex to) {
  if (!player_by_index(from) || !player_by_index(to) || from == to) return false;
  if (ball_.current_owner != from || team_of(from) != team_of(to) || !players_[to].active()) return false;
  actions_.cancel_for(from);
  restart_.reset();
  ActionPayload pl;
  pl.receiver = to;
  return actions_.schedule(ScheduledKind::Pass, from, tick_, tick_ + 1, players_[to].pos, pl).has_value();
}

bool MatchEngine::force_out_of_play(RestartKind kind, TeamSide side, const Coord10& spot) {
  award_restart(kind, side, spot.clamped_to_field());
  return true;
}

} // namespace fmsim
