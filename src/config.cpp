#include <fmsim/config.hpp>
#include <cmath>
#include <fstream>
#include <functional>
#include <map>
#include "csv_util.hpp"

namespace fmsim {

int EngineConfig::ticks_per_half() const {
  if (tick_seconds <= 0.0 || match_minutes <= 0) return 0;
  const double half_s = double(match_minutes) * 60.0 * 0.5;
  return static_cast<int>(std::lround(half_s / tick_seconds));
}

std::optional<std::string> validate_config(const EngineConfig& cfg) {
  if (!(cfg.tick_seconds > 0.0) || cfg.tick_seconds > 1.0) return std::string("tick_seconds must be in (0, 1]");
  if (cfg.substeps < 1 || cfg.substeps > 100) return std::string("substeps must be in [1, 100]");
  if (cfg.match_minutes < 1 || cfg.match_minutes > 150) return std::string("match_minutes must be in [1, 150]");
  if (!(cfg.ownership_threshold_m > 0.0)) return std::string("ownership_threshold_m must be positive");
  if (!(cfg.gk_catch_max_m >= cfg.header_max_m)) return std::string("gk_catch_max_m must be >= header_max_m");
  if (!(cfg.ball.mass_kg > 0.0)) return std::string("ball.mass_kg must be positive");
  if (cfg.ball.restitution < 0.0 || cfg.ball.restitution > 1.0) return std::string("ball.restitution must be in [0, 1]");
  if (cfg.ball.max_bounces < 0) return std::string("ball.max_bounces must be >= 0");
  return std::nullopt;
}

namespace {

using Setter = std::function<bool(EngineConfig&, const std::string&)>;

Setter real(double EngineConfig::* field) {
  return [field](EngineConfig& c, const std::string& v) {
    bool ok = false;
    const double d = detail::to_double_safe(v, ok);
    if (!ok || !std::isfinite(d)) return false;
    c.*field = d;
    return true;
  };
}

Setter ball_real(double BallPhysicsParams::* field) {
  return [field](EngineConfig& c, const std::string& v) {
    bool ok = false;
    const double d = detail::to_double_safe(v, ok);
    if (!ok || !std::isfinite(d)) return false;
    c.ball.*field = d;
    return true;
  };
}

Setter integer(int EngineConfig::* field) {
  return [field](EngineConfig& c, const std::string& v) {
    bool ok = false;
    const int i = detail::to_int_safe(v, ok);
    if (!ok) return false;
    c.*field = i;
    return true;
  };
}

Setter flag(bool EngineConfig::* field) {
  return [field](EngineConfig& c, const std::string& v) {
    bool ok = false;
    const bool b = detail::to_bool_safe(v, ok);
    if (!ok) return false;
    c.*field = b;
    return true;
  };
}

const std::map<std::string, Setter>& setters() {
  static const std::map<std::string, Setter> table = {
    {"tick_seconds",             real(&EngineConfig::tick_seconds)},
    {"substeps",                 integer(&EngineConfig::substeps)},
    {"match_minutes",            integer(&EngineConfig::match_minutes)},
    {"ownership_threshold_m",    real(&EngineConfig::ownership_threshold_m)},
    {"header_max_m",             real(&EngineConfig::header_max_m)},
    {"gk_catch_max_m",           real(&EngineConfig::gk_catch_max_m)},
    {"tackle_range_m",           real(&EngineConfig::tackle_range_m)},
    {"home_advantage",           real(&EngineConfig::home_advantage)},
    {"hero_bonus",               real(&EngineConfig::hero_bonus)},
    {"max_controllable_speed",   real(&EngineConfig::max_controllable_speed)},
    {"kick_cooldown_ticks",      integer(&EngineConfig::kick_cooldown_ticks)},
    {"possession_protect_ticks", integer(&EngineConfig::possession_protect_ticks)},
    {"decision_interval_ticks",  integer(&EngineConfig::decision_interval_ticks)},
    {"max_pressers",             integer(&EngineConfig::max_pressers)},
    {"record_trace",             flag(&EngineConfig::record_trace)},
    {"concentration_modifier",   flag(&EngineConfig::concentration_modifier)},
    {"ball.mass_kg",             ball_real(&BallPhysicsParams::mass_kg)},
    {"ball.drag_coefficient",    ball_real(&BallPhysicsParams::drag_coefficient)},
    {"ball.air_density",         ball_real(&BallPhysicsParams::air_density)},
    {"ball.cross_section_m2",    ball_real(&BallPhysicsParams::cross_section_m2)},
    {"ball.rolling_resistance",  ball_real(&BallPhysicsParams::rolling_resistance)},
    {"ball.gravity",             ball_real(&BallPhysicsParams::gravity)},
    {"ball.min_velocity",        ball_real(&BallPhysicsParams::min_velocity)},
    {"ball.restitution",         ball_real(&BallPhysicsParams::restitution)},
    {"ball.min_bounce_speed",    ball_real(&BallPhysicsParams::min_bounce_speed)},
    {"ball.bounce_friction",     ball_real(&BallPhysicsParams::bounce_friction)},
    {"ball.magnus_coefficient",  ball_real(&BallPhysicsParams::magnus_coefficient)},
    {"ball.magnus_power",        ball_real(&BallPhysicsParams::magnus_power)},
    {"ball.magnus_multiplier",   ball_real(&BallPhysicsParams::magnus_multiplier)},
    {"ball.spin_decay",          ball_real(&BallPhysicsParams::spin_decay)},
    {"ball.spin_deflection",     ball_real(&BallPhysicsParams::spin_deflection)},
    {"ball.curve_decay",         ball_real(&BallPhysicsParams::curve_decay)},
    {"ball.max_bounces", [](EngineConfig& c, const std::string& v) {
        bool ok = false;
        const int i = detail::to_int_safe(v, ok);
        if (ok) c.ball.max_bounces = i;
        return ok;
      }},
  };
  return table;
}

} // namespace

bool apply_config_value(EngineConfig& cfg, const std::string& key, const std::string& value) {
  const auto& table = setters();
  auto it = table.find(detail::lower(key));
  if (it == table.end()) return false;
  return it->second(cfg, value);
}

EngineConfig engine_config_from_csv_stream(std::istream& in) {
  EngineConfig cfg{};
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = detail::trim(line);
    if (detail::is_skippable(raw)) continue;

    const auto cols = detail::split_csv_line(raw);
    if (cols.size() < 2) continue;

    if (!header_consumed && detail::lower(cols[0]) == "key") {
      header_consumed = true;
      continue;
    }
    apply_config_value(cfg, cols[0], cols[1]); // unknown keys and bad values are skipped
  }
  return cfg;
}

std::optional<EngineConfig> load_engine_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return engine_config_from_csv_stream(f);
}

} // namespace fmsim
