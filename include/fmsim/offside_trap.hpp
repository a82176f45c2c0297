#pragma once
#include <cstdint>
#include <vector>
#include <fmsim/coord.hpp>

namespace fmsim {

struct OffsideTrapConfig {
  double min_line_m{20.0};             // from own goal line
  double max_line_m{60.0};
  double teamwork_threshold{65.0};
  double concentration_threshold{60.0};
  double attacker_window_m{5.0};       // attacker this close to the line -> trap chance
  double ball_zone_lo{0.30};           // ball progress, fraction of pitch length
  double ball_zone_hi{0.70};
};

// Defending team's line. Distances are meters from that team's own goal line.
struct DefensiveLine {
  double line_m{0.0};
  bool trap_active{false};
  double coordination{0.0};            // 0..1 from team teamwork
  std::uint64_t last_update_tick{0};
};

// Average of the deepest four values (all of them if fewer).
double compute_line_height(std::vector<double> defender_progress_m);

bool should_activate_trap(const DefensiveLine& line,
                          double ball_progress_m,
                          const std::vector<double>& attacker_progress_m,
                          double avg_teamwork,
                          double avg_concentration,
                          const OffsideTrapConfig& cfg);

// Trap line follows the ball, clamped to [min_line_m, max_line_m].
double compute_trap_line(double ball_progress_m, const OffsideTrapConfig& cfg);

// Recompute the line for one team. Positions are world coordinates; the
// direction context of the defending team converts them.
void update_defensive_line(DefensiveLine& line,
                           const DirectionContext& defending,
                           const std::vector<Coord10>& defenders,
                           const std::vector<Coord10>& opponent_attackers,
                           const Coord10& ball,
                           double avg_teamwork,
                           double avg_concentration,
                           bool trap_enabled,
                           std::uint64_t tick,
                           const OffsideTrapConfig& cfg = {});

// Offside position check in the attacking team's frame (meters from its own
// goal line). Level counts as onside; own half is always onside.
bool would_be_offside(double attacker_progress_m, double second_last_defender_progress_m, double ball_progress_m);

} // namespace fmsim
