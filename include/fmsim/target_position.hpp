#pragma once
#include <array>
#include <optional>
#include <fmsim/coord.hpp>
#include <fmsim/formation.hpp>
#include <fmsim/gk_sweeping.hpp>
#include <fmsim/offside_trap.hpp>
#include <fmsim/tactics.hpp>

namespace fmsim {

// Tuning of the layered blend (normalized team-view units).
struct TargetTuning {
  double microfocus_peak{0.15};
  double microfocus_width{0.25};
  double retention_dead_zone{0.2};
  double retention_ramp{0.3};
  double retention_max{0.5};
  double separation_radius{0.04};
  double separation_factor{0.15};
  double line_strength{0.6};
  double trap_coord_gain{0.3};
  double clamp_lo{0.05};
  double clamp_hi{0.95};
};

// Everything one player's target depends on. Positions are team view.
struct TargetContext {
  int slot{0};
  PositionKey position{PositionKey::CM};
  Waypoints wp{};
  PlayerInstructions instructions{};
  TacticalGoal goal{};
  bool team_has_possession{false};

  NormPos ball{};
  std::array<NormPos, 11> teammates{};     // current positions, self included
  std::array<bool, 11> active{};           // false for sent-off slots
  std::array<PositionRole, 11> roles{};

  int minute{0};
  int score_diff{0};                       // > 0: this team leads
  const DefensiveLine* line{nullptr};      // this team's line, if tracked

  // Keeper only.
  std::optional<NormPos> gk_target{};
  GkState gk_state{GkState::Attentive};
};

// Result after each layer, for inspection.
struct TargetBreakdown {
  NormPos tactical{};
  NormPos adjusted{};
  NormPos microfocus{};
  NormPos retention{};
  NormPos separation{};
  NormPos line{};
  NormPos final_pos{};
};

// Layer 1: explicit target for the current tactical goal.
NormPos tactical_goal_target(const TacticalGoal& goal, const Waypoints& wp, const NormPos& ball);

// Width/depth instructions.
NormPos apply_instructions(NormPos p, const PlayerInstructions& instr, const Waypoints& wp,
                           const NormPos& ball, bool attacking);

// Push forward late when losing, drop back very late when winning.
NormPos apply_late_game(NormPos p, int minute, int score_diff);

// Rectified-sine attraction: sin^2((1 - d/w) * pi/2) * peak, zero for d >= w.
double microfocus_strength(double distance, double peak, double width);

// Role multiplier on the microfocus peak.
double microfocus_role_multiplier(PositionRole role, bool ball_ahead);

NormPos compute_target(const TargetContext& ctx, const TargetTuning& tune = {}, TargetBreakdown* out = nullptr);

inline double norm_distance(const NormPos& a, const NormPos& b) {
  const double dw = a.width - b.width, dl = a.length - b.length;
  return std::sqrt(dw * dw + dl * dl);
}

} // namespace fmsim
