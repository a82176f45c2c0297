#pragma once
#include <cstdint>
#include <random>
#include <fmsim/geom.hpp>

namespace fmsim {

enum class ActionKind : std::uint8_t { Pass, Shot, Cross, FirstTouch, DribbleTouch, Save };

struct ErrorSigmas {
  double angle_deg{0.0};
  double dist{0.0};     // ratio
  double height{0.0};   // ratio
};

// Situational inputs. Attributes are 0..100, pressure and fatigue 0..1.
struct ErrorContext {
  double skill{50.0};           // the attribute relevant to the action
  double composure{50.0};
  double decisions{50.0};
  double concentration{50.0};
  double pressure{0.0};
  double fatigue{0.0};
  bool   weak_foot{false};
  double decision_quality{1.0}; // 0.5..2.0, higher = better choice

  // Clamps every field into range; NaN maps to the neutral value.
  ErrorContext clamped() const;
};

// Sampled imperfection for one action attempt.
struct ExecutionError {
  double dir_angle_deg{0.0};
  double dist_factor{1.0};
  double height_factor{1.0};
};

ErrorSigmas base_sigmas(ActionKind kind);

// Multiplier >= 1 from low concentration and fatigue (capped at +15%).
double concentration_multiplier(double concentration, double fatigue);

ErrorSigmas effective_sigmas(ActionKind kind, const ErrorContext& ctx, bool concentration_enabled);

// Three standard-normal draws, in order: angle, distance, height.
ExecutionError sample_execution_error(ActionKind kind,
                                      const ErrorContext& ctx,
                                      std::mt19937_64& rng,
                                      bool concentration_enabled = false);

// Error sampler with the concentration capability fixed at construction.
class ExecutionErrorModel {
public:
  ExecutionErrorModel() = default;
  explicit ExecutionErrorModel(bool concentration_enabled) : concentration_(concentration_enabled) {}

  bool concentration_enabled() const { return concentration_; }

  ExecutionError sample(ActionKind kind, const ErrorContext& ctx, std::mt19937_64& rng) const {
    return sample_execution_error(kind, ctx, rng, concentration_);
  }

private:
  bool concentration_{false};
};

// Rotate the origin->intended vector and scale its length. Intended returned
// unchanged when it coincides with origin.
Vec2 apply_error_to_target(const Vec2& origin, const Vec2& intended, const ExecutionError& err);

// Shot height scaled by height_factor, floored at zero.
double apply_error_to_height(double intended_height_m, const ExecutionError& err);

enum class TouchQuality : std::uint8_t { Perfect, Good, Heavy, Loose };

// Meters the ball escapes from the receiver.
inline double first_touch_control_distance(const ExecutionError& err) {
  const double d = std::abs(err.dist_factor - 1.0) * 4.0;
  return std::isfinite(d) ? d : 0.0;
}

TouchQuality classify_first_touch(double control_dist_m);

enum class Foot : std::uint8_t { Right, Left, Both };
enum class BodySide : std::uint8_t { Right, Left };

inline bool is_weak_foot(Foot preferred, BodySide side) {
  if (preferred == Foot::Both) return false;
  return (preferred == Foot::Right) != (side == BodySide::Right);
}

const char* to_string(ActionKind k);
const char* to_string(TouchQuality q);

} // namespace fmsim
