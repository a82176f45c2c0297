#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <fmsim/config.hpp>
#include <fmsim/roster.hpp>

namespace fmsim {

enum class SetupErrorKind : std::uint8_t {
  MissingGoalkeeper,
  WrongStarterCount,
  DuplicateSlot,
  SlotOutOfRange,
  UnknownFormation,
  AttributeOutOfRange,
  ScenarioOutOfBounds,
  InvalidConfig,
};

struct SetupError {
  SetupErrorKind kind{SetupErrorKind::InvalidConfig};
  std::string message;
};

const char* to_string(SetupErrorKind k);

// nullopt when the team can take the field.
std::optional<SetupError> validate_team(const TeamSpec& team, const char* side_label);

// nullopt when the plan can be simulated.
std::optional<SetupError> validate_match_plan(const MatchPlan& plan);

} // namespace fmsim
