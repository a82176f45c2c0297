#include <fmsim/ball.hpp>
#include <algorithm>
#include <cmath>

namespace fmsim {

static inline std::int32_t round_i32(double v) {
  if (!std::isfinite(v)) return 0;
  return static_cast<std::int32_t>(std::lround(std::clamp(v, -1.0e9, 1.0e9)));
}

LandingOutcome landing_transition(std::int32_t impact_vz, int bounce_count, const BallPhysicsParams& p) {
  const double impact = std::abs(units_to_meters(impact_vz));
  const double rebound = impact * p.restitution;
  if (rebound < p.min_bounce_speed || bounce_count >= p.max_bounces) {
    return LandingOutcome{BallPhase::Rolling, 0};
  }
  return LandingOutcome{BallPhase::Bouncing, meters_to_units(rebound)};
}

double height_cap_m(HeightProfile profile) {
  switch (profile) {
    case HeightProfile::Flat: return 0.0;
    case HeightProfile::Arc:  return 3.5;
    case HeightProfile::Lob:  return 10.0;
  }
  return 0.0;
}

double vz_for_profile(HeightProfile profile, double gravity) {
  const double h = height_cap_m(profile);
  if (h <= 0.0 || gravity <= 0.0) return 0.0;
  return std::sqrt(2.0 * gravity * h);
}

void launch_ball(Ball& b, const Vec2& vel_mps, double vz_mps, const Vec2& spin, double curve) {
  if (b.current_owner) b.previous_owner = b.current_owner;
  b.current_owner.reset();
  b.vel = Vel10::from_mps(vel_mps);
  b.vz = vz_mps > 0.0 ? meters_to_units(vz_mps) : 0;
  b.spin = sanitize(spin);
  b.curve_factor = std::isfinite(curve) ? std::clamp(curve, -1.0, 1.0) : 0.0;
  b.bounce_count = 0;
  b.phase = b.vz > 0 ? BallPhase::Airborne : BallPhase::Rolling;
  if (b.phase == BallPhase::Rolling) b.pos.z = 0;
}

void place_ball(Ball& b, const Coord10& at, std::optional<PlayerIndex> owner) {
  b.pos = Coord10{at.x, at.y, 0}.clamped_to_field();
  b.vel = {};
  b.vz = 0;
  b.spin = {};
  b.curve_factor = 0.0;
  b.bounce_count = 0;
  b.phase = BallPhase::Rolling;
  if (owner) {
    if (b.current_owner != owner) b.previous_owner = b.current_owner;
    b.current_owner = owner;
  } else {
    if (b.current_owner) b.previous_owner = b.current_owner;
    b.current_owner.reset();
  }
}

void sanitize_ball(Ball& b) {
  b.spin = sanitize(b.spin);
  if (!std::isfinite(b.curve_factor)) b.curve_factor = 0.0;
  b.pos = b.pos.clamped_to_field();
  if (b.phase == BallPhase::Rolling) { b.pos.z = 0; b.vz = 0; }
}

static void apply_gravity(Ball& b, const BallPhysicsParams& p, double dt) {
  b.vz -= round_i32(p.gravity * dt * double(kCoordUnitsPerM));
  b.pos.z += round_i32(double(b.vz) * dt);
  if (b.pos.z > kMaxHeight10) { b.pos.z = kMaxHeight10; if (b.vz > 0) b.vz = 0; }
  if (b.pos.z > 0 || b.vz >= 0) return;

  // Ground contact.
  b.pos.z = 0;
  const LandingOutcome out = landing_transition(b.vz, b.bounce_count, p);
  b.phase = out.next;
  if (out.next == BallPhase::Rolling) {
    b.vz = 0;
    b.bounce_count = 0;
    return;
  }

  b.vz = out.rebound_vz;
  ++b.bounce_count;

  Vec2 v = b.vel.to_mps() * (1.0 - p.bounce_friction);
  if (std::abs(b.curve_factor) >= p.min_curve) {
    const double speed = v.length();
    v += v.normalized().perpendicular() * (b.curve_factor * p.spin_deflection * speed);
    b.curve_factor *= p.curve_decay;
  }
  b.spin = b.spin * p.spin_decay;
  b.vel = Vel10::from_mps(v);
}

void integrate_substep(Ball& b, const BallPhysicsParams& p, double dt) {
  if (!(dt > 0.0)) return;

  // (a) drag + rolling resistance
  Vec2 v = sanitize(b.vel.to_mps());
  const double speed = v.length();
  if (speed <= p.min_velocity) {
    v = {};
    b.spin = {};
    b.curve_factor = 0.0;
  } else {
    const double drag = 0.5 * p.air_density * p.drag_coefficient * p.cross_section_m2 * speed * speed / p.mass_kg;
    const double rolling = b.is_airborne() ? 0.0 : p.rolling_resistance * p.gravity;
    const double new_speed = std::max(0.0, speed - (drag + rolling) * dt);
    v = v * (new_speed / speed);

    // (b) Magnus deflection from side spin, airborne only
    if (b.is_airborne()) {
      const double spin_mag = b.spin.length();
      if (spin_mag >= p.min_spin && new_speed >= p.min_velocity) {
        const double force = p.magnus_coefficient * std::pow(new_speed, p.magnus_power) * p.magnus_multiplier / 1000.0;
        v += v.normalized().perpendicular() * (force * b.spin.y * dt);
      }
      b.spin = b.spin * p.spin_decay;
    }
  }
  v = sanitize(v);
  b.vel = Vel10::from_mps(v);

  // (c) position
  b.pos.x += round_i32(double(b.vel.vx) * dt);
  b.pos.y += round_i32(double(b.vel.vy) * dt);

  // (d) vertical integrator
  if (b.is_airborne()) apply_gravity(b, p, dt);

  sanitize_ball(b);
}

int step_ball_tick(Ball& b, const BallPhysicsParams& p, double tick_seconds, int substeps) {
  if (b.is_owned() || substeps <= 0 || !(tick_seconds > 0.0)) return 0;
  const double dt = tick_seconds / double(substeps);
  int ran = 0;
  for (int i = 0; i < substeps; ++i) {
    if (b.is_stopped()) break;
    integrate_substep(b, p, dt);
    ++ran;
  }
  return ran;
}

Coord10 predict_ball_position(const Ball& b, const EngineConfig& cfg, int ticks_ahead) {
  Ball copy = b;
  copy.current_owner.reset();
  for (int t = 0; t < ticks_ahead && !copy.is_stopped(); ++t) {
    step_ball_tick(copy, cfg.ball, cfg.tick_seconds, cfg.substeps);
  }
  return copy.pos;
}

Coord10 predict_rest_position(const Ball& b, const EngineConfig& cfg, int max_ticks) {
  return predict_ball_position(b, cfg, max_ticks);
}

// Speed of a ground ball once it has covered distance_m, or 0 if it stops short.
static double arrival_speed(double launch, double distance_m, const EngineConfig& cfg) {
  Ball b;
  b.current_owner.reset();
  b.pos = Coord10::from_meters(0.0, kFieldWidthM * 0.5);
  launch_ball(b, Vec2{launch, 0.0}, 0.0);
  for (int t = 0; t < 2000; ++t) {
    step_ball_tick(b, cfg.ball, cfg.tick_seconds, cfg.substeps);
    if (b.pos.x_m() >= distance_m) return b.speed_mps();
    if (b.is_stopped()) return 0.0;
  }
  return 0.0;
}

double solve_ground_pass_speed(double distance_m, double arrival_mps, const EngineConfig& cfg,
                               double min_speed, double max_speed) {
  const double d = std::clamp(std::isfinite(distance_m) ? distance_m : 0.0, 0.5, 100.0);
  if (arrival_speed(min_speed, d, cfg) >= arrival_mps) return min_speed;
  if (arrival_speed(max_speed, d, cfg) < arrival_mps) return max_speed;
  double lo = min_speed, hi = max_speed;
  for (int i = 0; i < 20; ++i) {
    const double mid = 0.5 * (lo + hi);
    if (arrival_speed(mid, d, cfg) >= arrival_mps) hi = mid;
    else lo = mid;
  }
  return hi;
}

} // namespace fmsim
