#pragma once
#include <vector>
#include <fmsim/geom.hpp>

namespace fmsim {

// Steering primitives. Each returns a desired velocity (m/s), never a position.

Vec2 seek(const Vec2& current, const Vec2& target, double speed);

// Like seek, but slows linearly inside slowing_distance.
Vec2 arrive(const Vec2& current, const Vec2& target, double max_speed, double slowing_distance);

// Seek the target's predicted position (lookahead capped at max_lookahead_s).
Vec2 pursuit(const Vec2& current, const Vec2& target_pos, const Vec2& target_vel,
             double speed, double max_lookahead_s);

// Flee the target's predicted position.
Vec2 evade(const Vec2& current, const Vec2& threat_pos, const Vec2& threat_vel,
           double speed, double max_lookahead_s);

// Push away from neighbours closer than radius; strength falls off linearly.
Vec2 separation(const Vec2& current, const std::vector<Vec2>& neighbors,
                double radius, double strength);

// Limit a velocity change per step (acceleration cap).
Vec2 steer_toward(const Vec2& current_vel, const Vec2& desired_vel, double max_delta);

} // namespace fmsim
