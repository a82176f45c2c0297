#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <fmsim/engine.hpp>

namespace fmsim {

// Absolute state injected after setup. Positions in meters (world frame).
struct PlayerOverride {
  PlayerIndex idx{0};
  std::optional<Vec2> pos_m{};
  std::optional<Vec2> vel_mps{};
  bool scripted{false};   // keep the injected velocity, make no decisions
  bool remove{false};     // take the player out of the match
};

struct BallOverride {
  Vec2 pos_m{kFieldLengthM * 0.5, kFieldWidthM * 0.5};
  double height_m{0.0};
  Vec2 vel_mps{};
  double vz_mps{0.0};
  std::optional<PlayerIndex> owner{};
};

struct ForcedPass {
  PlayerIndex from{0};
  PlayerIndex to{0};
};

struct ForcedRestart {
  RestartKind kind{RestartKind::ThrowIn};
  TeamSide team{TeamSide::Home};
  Vec2 spot_m{};
};

struct ScenarioSetup {
  std::vector<PlayerOverride> players;
  std::optional<BallOverride> ball{};
  // Remove every player not named in `players`.
  bool only_listed_players{false};
};

// nullopt if every injected coordinate is finite and inside the pitch plus
// margin (height within 0..max).
std::optional<SetupError> validate_scenario(const ScenarioSetup& s);

// Engine with the scenario state applied on top of the kickoff setup.
std::variant<MatchEngine, SetupError> create_scenario_engine(const MatchPlan& plan,
                                                             const EngineConfig& cfg,
                                                             const ScenarioSetup& setup,
                                                             log::Logger* logger = nullptr);

bool apply_forced_pass(MatchEngine& engine, const ForcedPass& fp);
// False if the spot is outside the pitch plus margin.
bool apply_forced_restart(MatchEngine& engine, const ForcedRestart& fr);

struct EventExpectation {
  EventKind kind{EventKind::Goal};
  std::optional<TeamSide> team{};
  std::size_t min_count{1};
  std::optional<std::size_t> max_count{};
};

struct ScenarioExpectations {
  std::vector<EventExpectation> events;
  std::optional<Score> score{};
  // Outer nullopt: unchecked. Inner nullopt: ball must be loose.
  std::optional<std::optional<PlayerIndex>> ball_owner{};
  std::optional<Vec2> ball_pos_m{};
  double ball_pos_tolerance_m{0.5};
};

// Human-readable mismatches; empty when every expectation holds.
std::vector<std::string> check_expectations(const MatchEngine& engine, const ScenarioExpectations& ex);

} // namespace fmsim
