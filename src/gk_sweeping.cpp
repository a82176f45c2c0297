#include <fmsim/gk_sweeping.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace fmsim {

const char* to_string(GkState s) {
  switch (s) {
    case GkState::Attentive:        return "attentive";
    case GkState::ComingOut:        return "coming_out";
    case GkState::ReturningToGoal:  return "returning_to_goal";
    case GkState::PreparingForSave: return "preparing_for_save";
  }
  return "?";
}

bool ball_moving_toward_goal(const SweepingContext& ctx) {
  const double along = ctx.ball_vel_mps.x * ctx.defending.attack_direction().x +
                       ctx.ball_vel_mps.y * ctx.defending.attack_direction().y;
  return along < 0.0;
}

bool ball_in_danger_area(const SweepingContext& ctx, const SweepingConstants& k) {
  return ctx.defending.forward_progress_m(ctx.ball_pos) < k.danger_area_m;
}

bool can_reach_before_opponent(const SweepingContext& ctx, const Coord10& opponent,
                               const GkSkills& s, const SweepingConstants& k) {
  const double gk_speed = s.acceleration * 1.2 / 10.0;
  const double d_gk = ctx.gk_pos.distance_to_m(ctx.ball_pos);
  const double d_opp = opponent.distance_to_m(ctx.ball_pos);
  const double t_gk = gk_speed > 0.0 ? d_gk / gk_speed : std::numeric_limits<double>::max();
  const double t_opp = k.opponent_speed_mps > 0.0 ? d_opp / k.opponent_speed_mps : std::numeric_limits<double>::max();
  const double decision_advantage = std::clamp(s.decisions, 0.0, 100.0) / 200.0; // 0..0.5
  return t_gk < t_opp * (1.0 - decision_advantage);
}

ComeOutDecision should_come_out(const SweepingContext& ctx, const GkSkills& s, const SweepingConstants& k) {
  const double rushing_skill = (s.decisions + s.positioning) / 200.0;
  const double threshold = k.base_coming_out_m * (0.7 + rushing_skill * 0.6);
  const double ball_dist = ctx.gk_pos.distance_to_m(ctx.ball_pos);
  const double ball_speed = ctx.ball_vel_mps.length();

  // very close loose ball
  if (ball_dist < k.very_close_m && !ctx.opponent_has_ball) return {true, 1.0};

  // fast ball heading at goal in our half
  if (ball_moving_toward_goal(ctx) && ball_speed > k.min_threat_speed_mps &&
      ctx.defending.in_own_half(ctx.ball_pos)) {
    return {true, std::min(1.0, ball_speed / 20.0)};
  }

  if (!ctx.opponent_has_ball && ball_in_danger_area(ctx, k)) return {true, 0.7};

  // 1v1 race
  if (ctx.nearest_opponent) {
    const double opp_dist = ctx.gk_pos.distance_to_m(*ctx.nearest_opponent);
    if (opp_dist < threshold && can_reach_before_opponent(ctx, *ctx.nearest_opponent, s, k)) {
      return {true, std::clamp(1.0 - opp_dist / threshold, 0.3, 1.0)};
    }
  }
  return {false, 0.0};
}

Coord10 optimal_gk_position(const DirectionContext& defending, const Coord10& ball, double positioning) {
  const Coord10 goal = defending.own_goal_center();
  const Vec2 dir = goal.direction_to(ball);
  const double skill_factor = 0.8 + std::clamp(positioning, 0.0, 100.0) / 100.0 * 0.4;
  const double out_m = 5.0 * skill_factor;
  Vec2 p = goal.to_vec() + dir * out_m;

  // stay inside the penalty box
  NormPos tv = defending.to_team_view(Coord10::from_vec(p));
  const double max_len = kPenaltyAreaDepthM / kFieldLengthM;
  const double half_w = (kPenaltyAreaWidthM * 0.5) / kFieldWidthM;
  tv.length = std::clamp(tv.length, 0.0, max_len);
  tv.width = std::clamp(tv.width, 0.5 - half_w, 0.5 + half_w);
  return defending.from_team_view(tv);
}

static Coord10 interception_point(const Coord10& from, const Coord10& target, double pace) {
  const double dist = from.distance_to_m(target);
  if (dist < 1e-3) return target;
  const double step = std::min(pace / 10.0, dist);   // up to 10 m per decision
  const Vec2 p = from.to_vec() + from.direction_to(target) * step;
  return Coord10::from_vec(p);
}

Coord10 rushing_target(const SweepingContext& ctx, const GkSkills& s) {
  if (ctx.opponent_has_ball && ctx.nearest_opponent) {
    return interception_point(ctx.gk_pos, *ctx.nearest_opponent, s.pace);
  }
  return interception_point(ctx.gk_pos, ctx.ball_pos, s.pace);
}

GkState next_gk_state(GkState current, const SweepingContext& ctx, const GkSkills& s,
                      const SweepingConstants& k) {
  switch (current) {
    case GkState::Attentive:
      return should_come_out(ctx, s, k).come_out ? GkState::ComingOut : GkState::Attentive;

    case GkState::ComingOut:
      if (ctx.gk_pos.distance_to_m(ctx.ball_pos) < k.very_close_m) return GkState::PreparingForSave;
      if (!ball_in_danger_area(ctx, k)) return GkState::ReturningToGoal;
      return GkState::ComingOut;

    case GkState::ReturningToGoal: {
      const Coord10 home = ctx.defending.own_goal_center();
      if (ctx.gk_pos.distance_to_m(home) < k.back_in_goal_m) return GkState::Attentive;
      if (should_come_out(ctx, s, k).come_out) return GkState::ComingOut;
      return GkState::ReturningToGoal;
    }

    case GkState::PreparingForSave:
      return ball_in_danger_area(ctx, k) ? GkState::PreparingForSave : GkState::ReturningToGoal;
  }
  return GkState::Attentive;
}

double gk_blend_weight(GkState s) {
  switch (s) {
    case GkState::Attentive:        return 0.3;
    case GkState::ComingOut:        return 0.9;
    case GkState::ReturningToGoal:  return 0.7;
    case GkState::PreparingForSave: return 0.5;
  }
  return 0.3;
}

Coord10 gk_state_target(GkState s, const SweepingContext& ctx, const GkSkills& skills) {
  switch (s) {
    case GkState::ComingOut:
      return rushing_target(ctx, skills);
    case GkState::ReturningToGoal:
      return ctx.defending.forward_offset(ctx.defending.own_goal_center(), 1.0);
    case GkState::Attentive:
    case GkState::PreparingForSave:
      return optimal_gk_position(ctx.defending, ctx.ball_pos, skills.positioning);
  }
  return optimal_gk_position(ctx.defending, ctx.ball_pos, skills.positioning);
}

} // namespace fmsim
