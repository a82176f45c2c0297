#include <fmsim/target_position.hpp>
#include <algorithm>
#include <cmath>

namespace fmsim {

static inline NormPos blend(const NormPos& from, const NormPos& to, double t) {
  return NormPos{from.width + (to.width - from.width) * t, from.length + (to.length - from.length) * t};
}

NormPos tactical_goal_target(const TacticalGoal& goal, const Waypoints& wp, const NormPos& ball) {
  const double side = wp.base.width < 0.5 ? -1.0 : 1.0;   // which flank the slot belongs to
  if (goal.offensive) {
    switch (goal.off) {
      case OffensiveGoal::MoveToBall:
        return ball;
      case OffensiveGoal::AttackGoal:
        return NormPos{wp.offensive.width, 0.85};
      case OffensiveGoal::FindSpace:
        return NormPos{ball.width + side * 0.10, ball.length + 0.05};
      case OffensiveGoal::SupportTeammate:
        return NormPos{ball.width + side * 0.08, ball.length - 0.08};
      case OffensiveGoal::HoldPosition:
        return wp.offensive;
    }
    return wp.offensive;
  }

  switch (goal.def) {
    case DefensiveGoal::PressOpponent:
      return ball;
    case DefensiveGoal::TrackBack:
    case DefensiveGoal::HoldPosition:
      return wp.defensive;
    case DefensiveGoal::MarkPlayer:
      // goal side of the ball, halfway back to our line
      return NormPos{(wp.defensive.width + ball.width) * 0.5, ball.length * 0.5};
    case DefensiveGoal::BlockPassingLane: {
      const NormPos own_goal{0.5, 0.0};
      return blend(ball, own_goal, 0.3);
    }
  }
  return wp.defensive;
}

NormPos apply_instructions(NormPos p, const PlayerInstructions& instr, const Waypoints& wp,
                           const NormPos& ball, bool attacking) {
  switch (instr.width) {
    case WidthInstruction::StayWide:
      p.width += (p.width < 0.5 ? -0.05 : 0.05);
      break;
    case WidthInstruction::CutInside:
      p.width = p.width * 0.9 + 0.05;
      break;
    case WidthInstruction::Roam:
      p.width = wp.base.width * 0.7 + ball.width * 0.3;
      break;
    case WidthInstruction::Normal:
      break;
  }
  if (attacking) {
    if (instr.depth == DepthInstruction::GetForward) p.length += 0.08;
    else if (instr.depth == DepthInstruction::StayBack) p.length -= 0.08;
    p.length = std::clamp(p.length, 0.08, 0.92);
  }
  return clamp_norm(p, 0.05, 0.95);
}

NormPos apply_late_game(NormPos p, int minute, int score_diff) {
  if (minute >= 75 && score_diff < 0) {
    const double t = std::min(1.0, double(minute - 75) / 15.0);
    p.length += t * 0.08;
  } else if (minute >= 85 && score_diff > 0) {
    const double t = std::min(1.0, double(minute - 85) / 10.0);
    p.length -= t * 0.06;
  }
  return clamp_norm(p, 0.05, 0.95);
}

double microfocus_strength(double distance, double peak, double width) {
  if (!(width > 0.0) || !std::isfinite(distance) || distance >= width) return 0.0;
  const double s = std::sin((1.0 - std::max(0.0, distance) / width) * kPI * 0.5);
  return s * s * peak;
}

double microfocus_role_multiplier(PositionRole role, bool ball_ahead) {
  switch (role) {
    case PositionRole::Goalkeeper: return 0.0;
    case PositionRole::Defender:   return 0.7;
    case PositionRole::Midfielder: return 0.8;
    case PositionRole::Forward:    return ball_ahead ? 0.95 : 0.85;
  }
  return 0.8;
}

NormPos compute_target(const TargetContext& ctx, const TargetTuning& tune, TargetBreakdown* out) {
  const int self = std::clamp(ctx.slot, 0, 10);
  const NormPos here = ctx.teammates[self];
  const PositionRole role = role_of(ctx.position);
  const bool chasing_ball = ctx.goal.offensive ? ctx.goal.off == OffensiveGoal::MoveToBall
                                               : ctx.goal.def == DefensiveGoal::PressOpponent;

  // 1. tactical goal
  NormPos p = tactical_goal_target(ctx.goal, ctx.wp, ctx.ball);
  if (out) out->tactical = p;

  // 1b. instructions + match situation
  if (!chasing_ball) p = apply_instructions(p, ctx.instructions, ctx.wp, ctx.ball, ctx.team_has_possession);
  p = apply_late_game(p, ctx.minute, ctx.score_diff);
  if (out) out->adjusted = p;

  // 2. microfocus toward the ball
  {
    const bool ball_ahead = ctx.ball.length > here.length;
    const double strength = microfocus_strength(norm_distance(here, ctx.ball), tune.microfocus_peak, tune.microfocus_width)
                          * microfocus_role_multiplier(role, ball_ahead);
    p = blend(p, ctx.ball, strength);
  }
  if (out) out->microfocus = p;

  // 3. formation retention, defending only
  if (!ctx.team_has_possession && role != PositionRole::Goalkeeper) {
    const double drift = norm_distance(here, ctx.wp.defensive);
    const double pull = std::clamp((drift - tune.retention_dead_zone) / tune.retention_ramp, 0.0, tune.retention_max);
    p = blend(p, ctx.wp.defensive, pull);
  }
  if (out) out->retention = p;

  // 4. teammate separation, one pass
  {
    double sw = 0.0, sl = 0.0;
    for (int i = 0; i < 11; ++i) {
      if (i == self || !ctx.active[i]) continue;
      const double dw = here.width - ctx.teammates[i].width;
      const double dl = here.length - ctx.teammates[i].length;
      const double d = std::sqrt(dw * dw + dl * dl);
      if (d <= 0.001) {
        // stacked: the lower slot steps toward its left touchline, the higher one right
        sw += self < i ? -1.0 : 1.0;
      } else if (d < tune.separation_radius) {
        const double strength = (tune.separation_radius - d) / tune.separation_radius;
        sw += dw / d * strength;
        sl += dl / d * strength;
      }
    }
    p.width += sw * tune.separation_factor;
    p.length += sl * tune.separation_factor;
  }
  if (out) out->separation = p;

  // 5. defensive line
  if (role == PositionRole::Defender) {
    double sum = 0.0;
    int n = 0;
    for (int i = 0; i < 11; ++i) {
      if (!ctx.active[i] || ctx.roles[i] != PositionRole::Defender) continue;
      sum += ctx.teammates[i].length;
      ++n;
    }
    if (n >= 2) {
      const bool trap = ctx.line && ctx.line->trap_active;
      const double coord = ctx.line ? ctx.line->coordination : 0.0;
      const double line = trap ? ctx.line->line_m / kFieldLengthM : sum / double(n);
      const double strength = trap ? tune.line_strength + coord * tune.trap_coord_gain : tune.line_strength;
      p.length += (line - p.length) * strength;
      if (trap && coord > 0.7) p.width += (0.5 - p.width) * (coord - 0.7) * 0.5;
    }
  }
  if (out) out->line = p;

  // keeper sweeping
  if (role == PositionRole::Goalkeeper && ctx.gk_target) {
    p = blend(p, *ctx.gk_target, gk_blend_weight(ctx.gk_state));
  }

  p = clamp_norm(p, tune.clamp_lo, tune.clamp_hi);
  if (out) out->final_pos = p;
  return p;
}

} // namespace fmsim
