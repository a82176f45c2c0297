#pragma once
#include <cstdint>
#include <fmsim/geom.hpp>

namespace fmsim {

// Pitch geometry (meters).
inline constexpr double kFieldLengthM      = 105.0;
inline constexpr double kFieldWidthM       = 68.0;
inline constexpr double kFieldMarginM      = 1.0;    // audit margin around the pitch
inline constexpr double kMaxBallHeightM    = 50.0;
inline constexpr double kGoalWidthM        = 7.32;
inline constexpr double kGoalHeightM       = 2.44;
inline constexpr double kPenaltyAreaDepthM = 16.5;
inline constexpr double kPenaltyAreaWidthM = 40.32;

// Fixed-point resolution: 1 unit = 1 mm.
inline constexpr std::int32_t kCoordUnitsPerM = 1000;
inline constexpr std::int32_t kFieldLength10  = 105000;
inline constexpr std::int32_t kFieldWidth10   = 68000;
inline constexpr std::int32_t kFieldMargin10  = 1000;
inline constexpr std::int32_t kMaxHeight10    = 50000;

// Pitch axes. Length (goal to goal) is x, width (touchline to touchline) is y.
// Every length/width query goes through these two constants.
enum class Axis : std::uint8_t { X, Y };
inline constexpr Axis kLengthAxis = Axis::X;
inline constexpr Axis kWidthAxis  = Axis::Y;

// Planar offsets of `m` meters along one pitch axis.
inline Vec2 along_length(double m) { return kLengthAxis == Axis::X ? Vec2{m, 0.0} : Vec2{0.0, m}; }
inline Vec2 along_width(double m)  { return kWidthAxis == Axis::Y ? Vec2{0.0, m} : Vec2{m, 0.0}; }

std::int32_t meters_to_units(double m);
inline double units_to_meters(std::int32_t u) { return double(u) / double(kCoordUnitsPerM); }

// Integer-backed pitch position plus height.
struct Coord10 {
  std::int32_t x{0};
  std::int32_t y{0};
  std::int32_t z{0};   // height above the grass

  // Rounds to the nearest unit; non-finite input maps to 0. Does not clamp.
  static Coord10 from_meters(double x_m, double y_m, double h_m = 0.0);
  static Coord10 from_vec(const Vec2& v, double h_m = 0.0) { return from_meters(v.x, v.y, h_m); }
  static Coord10 center() { return {kFieldLength10 / 2, kFieldWidth10 / 2, 0}; }

  double x_m() const { return units_to_meters(x); }
  double y_m() const { return units_to_meters(y); }
  double height_m() const { return units_to_meters(z); }
  Vec2 to_vec() const { return {x_m(), y_m()}; }

  double length_m() const { return kLengthAxis == Axis::X ? x_m() : y_m(); }
  double width_m() const  { return kWidthAxis == Axis::Y ? y_m() : x_m(); }

  // Planar distance (height ignored).
  double distance_to_m(const Coord10& o) const;
  std::int32_t distance_to(const Coord10& o) const;
  Vec2 direction_to(const Coord10& o) const;
  Coord10 lerp(const Coord10& o, double t) const;
  Coord10 midpoint(const Coord10& o) const { return lerp(o, 0.5); }

  // Bounds plus the audit margin (ball); strictly inside the lines (players).
  Coord10 clamped_to_field() const;
  Coord10 clamped_in_bounds() const;
  bool in_bounds_with_margin() const;
  bool in_bounds() const;

  bool operator==(const Coord10&) const = default;
};

// Fixed-point planar velocity, 1 unit = 1 mm/s.
struct Vel10 {
  std::int32_t vx{0};
  std::int32_t vy{0};

  static Vel10 from_mps(const Vec2& v);
  Vec2 to_mps() const { return {units_to_meters(vx), units_to_meters(vy)}; }
  double speed_mps() const { return to_mps().length(); }
  bool is_zero() const { return vx == 0 && vy == 0; }
  bool operator==(const Vel10&) const = default;
};

enum class TeamSide : std::uint8_t { Home = 0, Away = 1 };

inline TeamSide opponent_of(TeamSide s) { return s == TeamSide::Home ? TeamSide::Away : TeamSide::Home; }

// Team-relative normalized position. width 0 = the team's left touchline,
// length 0 = own goal line, 1 = opponent goal line.
struct NormPos {
  double width{0.5};
  double length{0.5};
};

NormPos clamp_norm(NormPos p, double lo, double hi);

// Which way a team attacks during the current half.
struct DirectionContext {
  bool is_home{true};
  bool attacks_right{true};   // toward +length

  static DirectionContext for_team(TeamSide side) {
    const bool home = side == TeamSide::Home;
    return DirectionContext{home, home};
  }
  void swap_for_second_half() { attacks_right = !attacks_right; }

  double forward_sign() const { return attacks_right ? 1.0 : -1.0; }
  Vec2 attack_direction() const;
  double attack_goal_length_m() const { return attacks_right ? kFieldLengthM : 0.0; }
  double own_goal_length_m() const { return attacks_right ? 0.0 : kFieldLengthM; }
  Coord10 attack_goal_center() const;
  Coord10 own_goal_center() const;

  // Meters from own goal line toward the opponent goal line.
  double forward_progress_m(const Coord10& c) const;
  double distance_to_attack_goal_m(const Coord10& c) const;
  bool in_attacking_third(const Coord10& c) const { return forward_progress_m(c) >= kFieldLengthM * 2.0 / 3.0; }
  bool in_own_half(const Coord10& c) const { return forward_progress_m(c) < kFieldLengthM * 0.5; }
  bool in_own_penalty_area(const Coord10& c) const;
  Coord10 forward_offset(const Coord10& c, double meters) const;

  NormPos to_team_view(const Coord10& c) const;
  Coord10 from_team_view(const NormPos& p) const;
};

} // namespace fmsim
