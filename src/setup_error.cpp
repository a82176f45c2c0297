#include <fmsim/setup_error.hpp>
#include <array>
#include <cmath>
#include <string>

namespace fmsim {

const char* to_string(SetupErrorKind k) {
  switch (k) {
    case SetupErrorKind::MissingGoalkeeper:   return "missing_goalkeeper";
    case SetupErrorKind::WrongStarterCount:   return "wrong_starter_count";
    case SetupErrorKind::DuplicateSlot:       return "duplicate_slot";
    case SetupErrorKind::SlotOutOfRange:      return "slot_out_of_range";
    case SetupErrorKind::UnknownFormation:    return "unknown_formation";
    case SetupErrorKind::AttributeOutOfRange: return "attribute_out_of_range";
    case SetupErrorKind::ScenarioOutOfBounds: return "scenario_out_of_bounds";
    case SetupErrorKind::InvalidConfig:       return "invalid_config";
  }
  return "unknown";
}

static SetupError make_error(SetupErrorKind k, const char* side, const std::string& detail) {
  return SetupError{k, std::string(side) + ": " + detail};
}

std::optional<SetupError> validate_team(const TeamSpec& team, const char* side) {
  const auto formation = formation_by_key(team.formation);
  if (!formation) {
    return make_error(SetupErrorKind::UnknownFormation, side, "unknown formation '" + team.formation + "'");
  }
  if (team.starters.size() != 11) {
    return make_error(SetupErrorKind::WrongStarterCount, side,
                      "expected 11 starters, got " + std::to_string(team.starters.size()));
  }

  std::array<const PlayerSpec*, 11> by_slot{};
  for (std::size_t i = 0; i < team.starters.size(); ++i) {
    const auto& p = team.starters[i];
    const int slot = p.slot < 0 ? static_cast<int>(i) : p.slot;
    if (p.slot < -1 || slot > 10) {
      return make_error(SetupErrorKind::SlotOutOfRange, side,
                        "slot " + std::to_string(p.slot < -1 ? p.slot : slot) + " for '" + p.name + "' is outside 0..10");
    }
    if (by_slot[slot]) {
      return make_error(SetupErrorKind::DuplicateSlot, side,
                        "slot " + std::to_string(slot) + " assigned to '" + by_slot[slot]->name +
                        "' and '" + p.name + "'");
    }
    by_slot[slot] = &p;
  }

  if (by_slot[0]->position != PositionKey::GK) {
    return make_error(SetupErrorKind::MissingGoalkeeper, side,
                      "goalkeeper slot holds '" + by_slot[0]->name + "' (" + to_string(by_slot[0]->position) + ")");
  }

  auto check_attrs = [&](const PlayerSpec& p) -> std::optional<SetupError> {
    for (const auto& n : attribute_names()) {
      const double* v = attribute_field(p.attr, n);
      if (!v || !std::isfinite(*v) || *v < 0.0 || *v > 100.0) {
        return make_error(SetupErrorKind::AttributeOutOfRange, side,
                          "'" + p.name + "' " + n + " outside 0..100");
      }
    }
    if (!std::isfinite(p.stamina) || p.stamina < 0.0 || p.stamina > 1.0) {
      return make_error(SetupErrorKind::AttributeOutOfRange, side, "'" + p.name + "' stamina outside 0..1");
    }
    return std::nullopt;
  };
  for (const auto& p : team.starters) {
    if (auto e = check_attrs(p)) return e;
  }
  for (const auto& p : team.subs) {
    if (auto e = check_attrs(p)) return e;
  }
  return std::nullopt;
}

std::optional<SetupError> validate_match_plan(const MatchPlan& plan) {
  if (auto e = validate_team(plan.home, "home")) return e;
  if (auto e = validate_team(plan.away, "away")) return e;
  if (plan.user_player && (*plan.user_player < 0 || *plan.user_player > 21)) {
    return SetupError{SetupErrorKind::SlotOutOfRange,
                      "user_player " + std::to_string(*plan.user_player) + " is outside 0..21"};
  }
  return std::nullopt;
}

} // namespace fmsim
