#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace fmsim {

// Ball physics constants (SI units unless noted).
struct BallPhysicsParams {
  double mass_kg            = 0.43;
  double drag_coefficient   = 0.25;
  double air_density        = 1.225;   // kg/m^3
  double cross_section_m2   = 0.0388;  // 0.22 m diameter
  double rolling_resistance = 0.12;    // mu
  double gravity            = 9.81;    // m/s^2
  double min_velocity       = 0.1;     // m/s; at or below -> stopped
  double restitution        = 0.65;    // grass
  double min_bounce_speed   = 1.4;     // m/s rebound
  int    max_bounces        = 5;
  double bounce_friction    = 0.12;    // horizontal loss per bounce
  double magnus_coefficient = 0.94;
  double magnus_power       = 2.6;
  double magnus_multiplier  = 30.0;
  double spin_decay         = 0.97;    // per substep while airborne
  double min_spin           = 0.01;
  double spin_deflection    = 0.25;    // lateral kick on bounce per unit curve
  double curve_decay        = 0.7;     // per bounce
  double min_curve          = 0.05;
};

struct EngineConfig {
  double tick_seconds       = 0.05;    // 50 ms decision tick
  int    substeps           = 5;       // 5 x 10 ms
  int    match_minutes      = 90;

  double ownership_threshold_m = 5.0;
  double header_max_m          = 2.9;
  double gk_catch_max_m        = 3.3;
  double tackle_range_m        = 1.8;  // opponent distance that opens a contest
  double home_advantage        = 0.04; // tackle score multiplier bonus
  double hero_bonus            = 0.2;
  double max_controllable_speed = 14.0; // m/s; faster loose balls cannot be claimed
  int    kick_cooldown_ticks   = 6;
  int    possession_protect_ticks = 10;
  int    decision_interval_ticks  = 4;
  int    max_pressers          = 2;

  bool   record_trace           = false;
  bool   concentration_modifier = false; // capability flag

  BallPhysicsParams ball{};

  int ticks_per_half() const;
  int total_ticks() const { return 2 * ticks_per_half(); }
  double substep_seconds() const { return substeps > 0 ? tick_seconds / double(substeps) : tick_seconds; }
};

// Non-empty message when a value makes simulation impossible.
std::optional<std::string> validate_config(const EngineConfig& cfg);

// Set one field by key (e.g. "substeps", "ball.restitution"). False if the
// key is unknown or the value does not parse.
bool apply_config_value(EngineConfig& cfg, const std::string& key, const std::string& value);

// Stream-based key,value CSV loader on top of defaults.
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
EngineConfig engine_config_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<EngineConfig> load_engine_config_csv(const std::string& path);

} // namespace fmsim
