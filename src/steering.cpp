#include <fmsim/steering.hpp>
#include <algorithm>
#include <cmath>

namespace fmsim {

Vec2 seek(const Vec2& current, const Vec2& target, double speed) {
  if (!(speed > 0.0)) return {};
  return (target - current).normalized() * speed;
}

Vec2 arrive(const Vec2& current, const Vec2& target, double max_speed, double slowing_distance) {
  if (!(max_speed > 0.0)) return {};
  const Vec2 to_target = target - current;
  const double dist = to_target.length();
  if (dist < 1e-4) return {};

  double speed = max_speed;
  if (slowing_distance > 0.0) speed = max_speed * std::clamp(dist / slowing_distance, 0.0, 1.0);
  return to_target * (speed / dist);
}

static Vec2 predicted(const Vec2& current, const Vec2& pos, const Vec2& vel,
                      double speed, double max_lookahead_s) {
  const double dist = (pos - current).length();
  const double lookahead = std::min(dist / speed, std::max(0.0, max_lookahead_s));
  return pos + vel * lookahead;
}

Vec2 pursuit(const Vec2& current, const Vec2& target_pos, const Vec2& target_vel,
             double speed, double max_lookahead_s) {
  if (!(speed > 0.0)) return {};
  return seek(current, predicted(current, target_pos, target_vel, speed, max_lookahead_s), speed);
}

Vec2 evade(const Vec2& current, const Vec2& threat_pos, const Vec2& threat_vel,
           double speed, double max_lookahead_s) {
  if (!(speed > 0.0)) return {};
  const Vec2 future = predicted(current, threat_pos, threat_vel, speed, max_lookahead_s);
  return (current - future).normalized() * speed;
}

Vec2 separation(const Vec2& current, const std::vector<Vec2>& neighbors,
                double radius, double strength) {
  if (!(radius > 0.0) || !(strength > 0.0)) return {};
  Vec2 force{};
  for (const auto& n : neighbors) {
    const Vec2 away = current - n;
    const double d = away.length();
    if (d > 0.0 && d < radius) {
      force += away * ((1.0 - d / radius) * strength / d);
    }
  }
  return force;
}

Vec2 steer_toward(const Vec2& current_vel, const Vec2& desired_vel, double max_delta) {
  const Vec2 delta = desired_vel - current_vel;
  const double len = delta.length();
  if (len <= max_delta || len < 1e-9) return desired_vel;
  return current_vel + delta * (max_delta / len);
}

} // namespace fmsim
