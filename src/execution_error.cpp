#include <fmsim/execution_error.hpp>
#include <algorithm>
#include <cmath>

namespace fmsim {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

static inline double finite_or(double x, double fallback) {
  return std::isfinite(x) ? x : fallback;
}

ErrorContext ErrorContext::clamped() const {
  ErrorContext c = *this;
  c.skill            = std::clamp(finite_or(skill, 50.0), 0.0, 100.0);
  c.composure        = std::clamp(finite_or(composure, 50.0), 0.0, 100.0);
  c.decisions        = std::clamp(finite_or(decisions, 50.0), 0.0, 100.0);
  c.concentration    = std::clamp(finite_or(concentration, 50.0), 0.0, 100.0);
  c.pressure         = clamp01(finite_or(pressure, 0.0));
  c.fatigue          = clamp01(finite_or(fatigue, 0.0));
  c.decision_quality = std::clamp(finite_or(decision_quality, 1.0), 0.5, 2.0);
  return c;
}

ErrorSigmas base_sigmas(ActionKind kind) {
  switch (kind) {
    case ActionKind::Shot:         return {5.0, 0.10, 0.15};
    case ActionKind::Pass:         return {4.0, 0.08, 0.05};
    case ActionKind::Cross:        return {8.0, 0.12, 0.15};
    case ActionKind::FirstTouch:   return {3.0, 0.12, 0.06};
    case ActionKind::DribbleTouch: return {3.0, 0.10, 0.05};
    case ActionKind::Save:         return {4.0, 0.06, 0.06};
  }
  return {4.0, 0.08, 0.05};
}

double concentration_multiplier(double concentration, double fatigue) {
  const double c = std::clamp(finite_or(concentration, 50.0), 0.0, 100.0);
  const double f = clamp01(finite_or(fatigue, 0.0));
  const double penalty = (1.0 - c / 100.0) * 0.10 * (1.0 + 0.5 * f);
  return 1.0 + std::clamp(penalty, 0.0, 0.15);
}

ErrorSigmas effective_sigmas(ActionKind kind, const ErrorContext& raw, bool concentration_enabled) {
  const ErrorContext ctx = raw.clamped();
  const ErrorSigmas base = base_sigmas(kind);

  const double skill = (100.0 - ctx.skill) / 100.0;
  const double calm  = clamp01((ctx.composure + ctx.decisions) / 200.0);
  const double weak  = ctx.weak_foot ? 1.0 : 0.0;
  const double conc  = concentration_enabled ? concentration_multiplier(ctx.concentration, ctx.fatigue) : 1.0;
  const double dq    = std::clamp(1.0 / ctx.decision_quality, 0.85, 1.20);

  ErrorSigmas s;
  s.angle_deg = base.angle_deg
              * (1.0 + 0.8 * skill + 0.7 * ctx.pressure + 0.5 * ctx.fatigue + 0.5 * weak)
              * (1.2 - 0.5 * calm) * conc * dq;
  s.dist = base.dist
         * (1.0 + 0.5 * skill + 0.4 * ctx.pressure + 0.3 * ctx.fatigue)
         * (1.2 - 0.4 * calm) * conc * dq;
  s.height = base.height
           * (1.0 + 0.5 * skill + 0.3 * ctx.pressure)
           * (1.1 - 0.3 * calm) * conc * dq;
  return s;
}

ExecutionError sample_execution_error(ActionKind kind,
                                      const ErrorContext& ctx,
                                      std::mt19937_64& rng,
                                      bool concentration_enabled) {
  const ErrorSigmas s = effective_sigmas(kind, ctx, concentration_enabled);
  std::normal_distribution<double> N(0.0, 1.0);
  const double a = N(rng);
  const double d = N(rng);
  const double h = N(rng);

  ExecutionError e;
  e.dir_angle_deg = finite_or(a * s.angle_deg, 0.0);
  e.dist_factor   = finite_or(1.0 + d * s.dist, 1.0);
  e.height_factor = finite_or(1.0 + h * s.height, 1.0);
  return e;
}

Vec2 apply_error_to_target(const Vec2& origin, const Vec2& intended, const ExecutionError& err) {
  const Vec2 delta = intended - origin;
  const double dist = delta.length();
  if (dist < 0.001 || !std::isfinite(dist)) return intended;
  const Vec2 dir = (delta * (1.0 / dist)).rotated_deg(err.dir_angle_deg);
  const double scaled = dist * std::max(0.0, err.dist_factor);
  return sanitize(origin + dir * scaled);
}

double apply_error_to_height(double intended_height_m, const ExecutionError& err) {
  const double h = intended_height_m * err.height_factor;
  return std::isfinite(h) ? std::max(0.0, h) : 0.0;
}

TouchQuality classify_first_touch(double control_dist_m) {
  if (control_dist_m < 0.5) return TouchQuality::Perfect;
  if (control_dist_m < 1.5) return TouchQuality::Good;
  if (control_dist_m < 2.5) return TouchQuality::Heavy;
  return TouchQuality::Loose;
}

const char* to_string(ActionKind k) {
  switch (k) {
    case ActionKind::Pass:         return "pass";
    case ActionKind::Shot:         return "shot";
    case ActionKind::Cross:        return "cross";
    case ActionKind::FirstTouch:   return "first_touch";
    case ActionKind::DribbleTouch: return "dribble_touch";
    case ActionKind::Save:         return "save";
  }
  return "unknown";
}

const char* to_string(TouchQuality q) {
  switch (q) {
    case TouchQuality::Perfect: return "perfect";
    case TouchQuality::Good:    return "good";
    case TouchQuality::Heavy:   return "heavy";
    case TouchQuality::Loose:   return "loose";
  }
  return "unknown";
}

} // namespace fmsim
