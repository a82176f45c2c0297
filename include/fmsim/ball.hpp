#pragma once
#include <cstdint>
#include <optional>
#include <fmsim/config.hpp>
#include <fmsim/coord.hpp>
#include <fmsim/geom.hpp>

namespace fmsim {

// Player slot 0..21 (0-10 home, 11-21 away).
using PlayerIndex = int;
inline constexpr int kPlayersPerTeam = 11;
inline constexpr int kPlayerCount = 22;

inline TeamSide team_of(PlayerIndex idx) { return idx < kPlayersPerTeam ? TeamSide::Home : TeamSide::Away; }
inline int slot_of(PlayerIndex idx) { return idx % kPlayersPerTeam; }
inline PlayerIndex player_index(TeamSide side, int slot) { return (side == TeamSide::Home ? 0 : kPlayersPerTeam) + slot; }

enum class BallPhase : std::uint8_t { Airborne, Bouncing, Rolling };

enum class HeightProfile : std::uint8_t { Flat, Arc, Lob };

struct Ball {
  Coord10 pos{Coord10::center()};   // z is the height
  Vel10 vel{};                      // horizontal
  std::int32_t vz{0};               // vertical, mm/s
  Vec2 spin{};                      // x: top/back spin, y: side spin
  std::optional<PlayerIndex> current_owner{};
  std::optional<PlayerIndex> previous_owner{};
  BallPhase phase{BallPhase::Rolling};
  int bounce_count{0};
  double curve_factor{0.0};

  bool is_rolling() const { return phase == BallPhase::Rolling; }
  bool is_airborne() const { return phase != BallPhase::Rolling; }
  bool is_owned() const { return current_owner.has_value(); }
  bool is_stopped() const { return vel.is_zero() && !is_airborne(); }
  double speed_mps() const { return vel.speed_mps(); }
  double height_m() const { return pos.height_m(); }
};

// Result of a ground contact.
struct LandingOutcome {
  BallPhase next{BallPhase::Rolling};
  std::int32_t rebound_vz{0};   // mm/s, upward
};

// Bounce/roll transition for an impact at |impact_vz| mm/s.
LandingOutcome landing_transition(std::int32_t impact_vz, int bounce_count, const BallPhysicsParams& p);

// Launch velocity for a height profile (m/s upward).
double vz_for_profile(HeightProfile profile, double gravity);
double height_cap_m(HeightProfile profile);

// Release the ball from its owner with the given velocities.
void launch_ball(Ball& b, const Vec2& vel_mps, double vz_mps, const Vec2& spin = {}, double curve = 0.0);

// Put the ball at a spot, stopped, optionally owned.
void place_ball(Ball& b, const Coord10& at, std::optional<PlayerIndex> owner = std::nullopt);

// One physics substep of dt seconds.
void integrate_substep(Ball& b, const BallPhysicsParams& p, double dt);

// One decision tick split into substeps. Returns the number of substeps run
// (fewer than requested once the ball comes to rest).
int step_ball_tick(Ball& b, const BallPhysicsParams& p, double tick_seconds, int substeps);

// Zero non-finite spin/curve and re-clamp position.
void sanitize_ball(Ball& b);

// Forward prediction on a copy of the ball.
Coord10 predict_ball_position(const Ball& b, const EngineConfig& cfg, int ticks_ahead);
Coord10 predict_rest_position(const Ball& b, const EngineConfig& cfg, int max_ticks = 400);

// Ground pass launch speed (m/s) so that the ball still moves at roughly
// arrival_mps after distance_m. Searched by running the integrator.
double solve_ground_pass_speed(double distance_m, double arrival_mps, const EngineConfig& cfg,
                               double min_speed = 3.0, double max_speed = 30.0);

} // namespace fmsim
