#pragma once
#include <cstdint>
#include <optional>
#include <fmsim/coord.hpp>
#include <fmsim/geom.hpp>

namespace fmsim {

enum class GkState : std::uint8_t { Attentive, ComingOut, ReturningToGoal, PreparingForSave };

const char* to_string(GkState s);

// Keeper ratings used by sweeping decisions (0..100).
struct GkSkills {
  double decisions{50}, positioning{50}, anticipation{50}, bravery{50};
  double pace{50}, acceleration{50}, agility{50};
};

struct SweepingConstants {
  double base_coming_out_m{20.0};   // 1v1 window, scaled 0.7..1.3 by skill
  double danger_area_m{20.0};       // from own goal line
  double min_threat_speed_mps{10.0};
  double very_close_m{10.0};
  double back_in_goal_m{5.0};
  double opponent_speed_mps{7.0};
};

struct SweepingContext {
  Coord10 gk_pos{};
  Coord10 ball_pos{};
  Vec2 ball_vel_mps{};
  bool opponent_has_ball{false};
  std::optional<Coord10> nearest_opponent{};
  DirectionContext defending{};   // the keeper's team
};

struct ComeOutDecision {
  bool come_out{false};
  double urgency{0.0};  // 0..1
};

bool ball_moving_toward_goal(const SweepingContext& ctx);
bool ball_in_danger_area(const SweepingContext& ctx, const SweepingConstants& k = {});
bool can_reach_before_opponent(const SweepingContext& ctx, const Coord10& opponent,
                               const GkSkills& s, const SweepingConstants& k = {});

ComeOutDecision should_come_out(const SweepingContext& ctx, const GkSkills& s, const SweepingConstants& k = {});

// Point on the goal-to-ball line 4..6 m out (by positioning), clamped to the box.
Coord10 optimal_gk_position(const DirectionContext& defending, const Coord10& ball, double positioning);

// Where to run when coming out: the ball carrier if an opponent has it, else the ball.
Coord10 rushing_target(const SweepingContext& ctx, const GkSkills& s);

// Single transition function of the sweeping state machine.
GkState next_gk_state(GkState current, const SweepingContext& ctx, const GkSkills& s,
                      const SweepingConstants& k = {});

// Blend weight toward the sweeping target for the target-position calculator.
double gk_blend_weight(GkState s);

// Target the keeper heads for in a given state.
Coord10 gk_state_target(GkState s, const SweepingContext& ctx, const GkSkills& skills);

} // namespace fmsim
