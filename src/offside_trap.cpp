#include <fmsim/offside_trap.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>

namespace fmsim {

double compute_line_height(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::sort(v.begin(), v.end());
  const std::size_t n = std::min<std::size_t>(v.size(), 4);
  return std::accumulate(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(n), 0.0) / double(n);
}

bool should_activate_trap(const DefensiveLine& line,
                          double ball_progress_m,
                          const std::vector<double>& attacker_progress_m,
                          double avg_teamwork,
                          double avg_concentration,
                          const OffsideTrapConfig& cfg) {
  if (avg_teamwork < cfg.teamwork_threshold) return false;
  if (avg_concentration < cfg.concentration_threshold) return false;

  const double frac = ball_progress_m / kFieldLengthM;
  if (frac <= cfg.ball_zone_lo || frac >= cfg.ball_zone_hi) return false;

  return std::any_of(attacker_progress_m.begin(), attacker_progress_m.end(), [&](double a) {
    return std::abs(a - line.line_m) < cfg.attacker_window_m;
  });
}

double compute_trap_line(double ball_progress_m, const OffsideTrapConfig& cfg) {
  return std::clamp(std::min(ball_progress_m, cfg.max_line_m), cfg.min_line_m, cfg.max_line_m);
}

void update_defensive_line(DefensiveLine& line,
                           const DirectionContext& defending,
                           const std::vector<Coord10>& defenders,
                           const std::vector<Coord10>& opponent_attackers,
                           const Coord10& ball,
                           double avg_teamwork,
                           double avg_concentration,
                           bool trap_enabled,
                           std::uint64_t tick,
                           const OffsideTrapConfig& cfg) {
  line.coordination = std::clamp(avg_teamwork / 100.0, 0.0, 1.0);
  line.last_update_tick = tick;
  if (defenders.empty()) {
    line.trap_active = false;
    return;
  }

  std::vector<double> prog;
  prog.reserve(defenders.size());
  for (const auto& d : defenders) prog.push_back(defending.forward_progress_m(d));
  line.line_m = compute_line_height(prog);

  if (!trap_enabled) {
    line.trap_active = false;
    return;
  }

  // Attackers measured in the defending team's frame.
  std::vector<double> att;
  att.reserve(opponent_attackers.size());
  for (const auto& a : opponent_attackers) att.push_back(defending.forward_progress_m(a));

  const double ball_prog = defending.forward_progress_m(ball);
  line.trap_active = should_activate_trap(line, ball_prog, att, avg_teamwork, avg_concentration, cfg);
  if (line.trap_active) line.line_m = compute_trap_line(ball_prog, cfg);
}

bool would_be_offside(double attacker_progress_m, double second_last_defender_progress_m, double ball_progress_m) {
  if (attacker_progress_m <= kFieldLengthM * 0.5) return false;
  if (attacker_progress_m <= ball_progress_m) return false;
  return attacker_progress_m > second_last_defender_progress_m;
}

} // namespace fmsim
