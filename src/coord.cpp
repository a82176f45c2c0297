#include <fmsim/coord.hpp>
#include <algorithm>
#include <cmath>

namespace fmsim {

std::int32_t meters_to_units(double m) {
  if (!std::isfinite(m)) return 0;
  // Keep far outside any pitch value but well inside int32.
  const double u = std::clamp(m * double(kCoordUnitsPerM), -1.0e9, 1.0e9);
  return static_cast<std::int32_t>(std::lround(u));
}

Coord10 Coord10::from_meters(double x_m, double y_m, double h_m) {
  return Coord10{meters_to_units(x_m), meters_to_units(y_m), meters_to_units(h_m)};
}

double Coord10::distance_to_m(const Coord10& o) const {
  const double dx = units_to_meters(o.x - x);
  const double dy = units_to_meters(o.y - y);
  return std::sqrt(dx * dx + dy * dy);
}

std::int32_t Coord10::distance_to(const Coord10& o) const {
  return meters_to_units(distance_to_m(o));
}

Vec2 Coord10::direction_to(const Coord10& o) const {
  return (o.to_vec() - to_vec()).normalized();
}

Coord10 Coord10::lerp(const Coord10& o, double t) const {
  return Coord10{
    x + static_cast<std::int32_t>(std::lround(double(o.x - x) * t)),
    y + static_cast<std::int32_t>(std::lround(double(o.y - y) * t)),
    z + static_cast<std::int32_t>(std::lround(double(o.z - z) * t)),
  };
}

Coord10 Coord10::clamped_to_field() const {
  return Coord10{
    std::clamp(x, -kFieldMargin10, kFieldLength10 + kFieldMargin10),
    std::clamp(y, -kFieldMargin10, kFieldWidth10 + kFieldMargin10),
    std::clamp(z, 0, kMaxHeight10),
  };
}

Coord10 Coord10::clamped_in_bounds() const {
  return Coord10{
    std::clamp(x, 0, kFieldLength10),
    std::clamp(y, 0, kFieldWidth10),
    std::clamp(z, 0, kMaxHeight10),
  };
}

bool Coord10::in_bounds_with_margin() const {
  return x >= -kFieldMargin10 && x <= kFieldLength10 + kFieldMargin10 &&
         y >= -kFieldMargin10 && y <= kFieldWidth10 + kFieldMargin10 &&
         z >= 0 && z <= kMaxHeight10;
}

bool Coord10::in_bounds() const {
  return x >= 0 && x <= kFieldLength10 && y >= 0 && y <= kFieldWidth10;
}

Vel10 Vel10::from_mps(const Vec2& v) {
  const Vec2 s = sanitize(v);
  return Vel10{meters_to_units(s.x), meters_to_units(s.y)};
}

NormPos clamp_norm(NormPos p, double lo, double hi) {
  p.width  = std::isfinite(p.width)  ? std::clamp(p.width, lo, hi)  : 0.5;
  p.length = std::isfinite(p.length) ? std::clamp(p.length, lo, hi) : 0.5;
  return p;
}

Vec2 DirectionContext::attack_direction() const {
  return kLengthAxis == Axis::X ? Vec2{forward_sign(), 0.0} : Vec2{0.0, forward_sign()};
}

Coord10 DirectionContext::attack_goal_center() const {
  return from_team_view(NormPos{0.5, 1.0});
}

Coord10 DirectionContext::own_goal_center() const {
  return from_team_view(NormPos{0.5, 0.0});
}

double DirectionContext::forward_progress_m(const Coord10& c) const {
  return attacks_right ? c.length_m() : kFieldLengthM - c.length_m();
}

double DirectionContext::distance_to_attack_goal_m(const Coord10& c) const {
  return c.distance_to_m(attack_goal_center());
}

bool DirectionContext::in_own_penalty_area(const Coord10& c) const {
  const double depth = forward_progress_m(c);
  const double half_w = kPenaltyAreaWidthM * 0.5;
  const double w = c.width_m() - kFieldWidthM * 0.5;
  return depth >= 0.0 && depth <= kPenaltyAreaDepthM && std::abs(w) <= half_w;
}

Coord10 DirectionContext::forward_offset(const Coord10& c, double meters) const {
  const Vec2 p = c.to_vec() + attack_direction() * meters;
  Coord10 out = Coord10::from_vec(p);
  out.z = c.z;
  return out;
}

// Attacking +length, the team's left is the +width touchline; the view is a
// half-turn rotation for the other direction so left-sided roles face each
// other's right-sided roles.
NormPos DirectionContext::to_team_view(const Coord10& c) const {
  const double l = c.length_m() / kFieldLengthM;
  const double w = c.width_m() / kFieldWidthM;
  if (attacks_right) return NormPos{1.0 - w, l};
  return NormPos{w, 1.0 - l};
}

Coord10 DirectionContext::from_team_view(const NormPos& p) const {
  double l = p.length, w = p.width;
  if (attacks_right) { w = 1.0 - w; }
  else               { l = 1.0 - l; }
  const double len_m = l * kFieldLengthM;
  const double wid_m = w * kFieldWidthM;
  if (kLengthAxis == Axis::X) return Coord10::from_meters(len_m, wid_m);
  return Coord10::from_meters(wid_m, len_m);
}

} // namespace fmsim
