#pragma once
#include <cmath>
#include <numbers>

namespace fmsim {

inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;
inline constexpr double kDegToRad = kPI / 180.0;

// Planar vector in meters (or meters per second).
struct Vec2 {
  double x{};
  double y{};

  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(double k) const { return {x * k, y * k}; }
  Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
  bool operator==(const Vec2&) const = default;

  double length() const { return std::sqrt(x * x + y * y); }
  double length_sq() const { return x * x + y * y; }
  bool finite() const { return std::isfinite(x) && std::isfinite(y); }

  // Unit vector, or zero for (near) zero length.
  Vec2 normalized() const {
    const double len = length();
    if (len < 1e-4) return {};
    return {x / len, y / len};
  }

  // Counter-clockwise perpendicular.
  Vec2 perpendicular() const { return {-y, x}; }

  Vec2 rotated_deg(double deg) const {
    const double a = deg * kDegToRad;
    const double c = std::cos(a), s = std::sin(a);
    return {x * c - y * s, x * s + y * c};
  }
};

inline double distance(const Vec2& a, const Vec2& b) { return (a - b).length(); }

inline Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
  return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

// Zero out NaN/inf components.
inline Vec2 sanitize(const Vec2& v) {
  return {std::isfinite(v.x) ? v.x : 0.0, std::isfinite(v.y) ? v.y : 0.0};
}

} // namespace fmsim
