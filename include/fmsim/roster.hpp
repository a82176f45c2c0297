#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <fmsim/execution_error.hpp>
#include <fmsim/formation.hpp>
#include <fmsim/tactics.hpp>

namespace fmsim {

// Player ratings, 0..100.
struct PlayerAttributes {
  // physical
  double pace{50}, acceleration{50}, agility{50}, strength{50}, stamina{50};
  // technical
  double technique{50}, passing{50}, finishing{50}, dribbling{50}, first_touch{50};
  double crossing{50}, tackling{50}, marking{50}, heading{50}, long_shots{50};
  // mental
  double composure{50}, decisions{50}, concentration{50}, anticipation{50}, positioning{50};
  double vision{50}, off_the_ball{50}, teamwork{50}, work_rate{50}, aggression{50};
  double bravery{50}, flair{50};
  // goalkeeping
  double handling{50}, reflexes{50};
};

// Name/value access for loaders and validation. Returns nullptr for unknown names.
double* attribute_field(PlayerAttributes& a, std::string_view name);
const double* attribute_field(const PlayerAttributes& a, std::string_view name);
const std::vector<std::string>& attribute_names();

GoalAttributes goal_attributes(const PlayerAttributes& a);

struct PlayerSpec {
  int slot{-1};          // formation slot 0..10; -1 = position in the starters list
  std::string name;
  PositionKey position{PositionKey::CM};
  Foot foot{Foot::Right};
  PlayerAttributes attr{};
  double stamina{1.0};   // match fitness at kickoff, 0..1
};

struct TeamSpec {
  std::string name;
  std::string formation{"442"};
  std::vector<PlayerSpec> starters;    // slot order 0..10
  std::vector<PlayerSpec> subs;
  TeamInstructions instructions{};
};

enum class AiDifficulty : std::uint8_t { Easy, Normal, Hard };

// Decision-quality multiplier fed to the error model for AI teams.
double decision_quality_for(AiDifficulty d);

struct MatchPlan {
  TeamSpec home;
  TeamSpec away;
  std::uint64_t seed{0};
  AiDifficulty difficulty{AiDifficulty::Normal};
  std::optional<int> user_player{};   // 0..21, highlight and hero bonus
};

// Rows: slot,name,position,foot,<attribute columns named in the header>.
// The header row is required (it names the attribute columns); missing
// attributes keep their default. slot "sub" (or empty) adds a substitute.
// Ignores '#' comments and blank lines; invalid rows are skipped.
TeamSpec team_from_csv_stream(std::istream& in, const std::string& name, const std::string& formation);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<TeamSpec> load_team_csv(const std::string& path, const std::string& name, const std::string& formation);

// Deterministic demo side: every attribute around `rating`, shaped by role.
TeamSpec demo_team(const std::string& name, const std::string& formation = "442", double rating = 65.0);

std::optional<Foot> foot_from_string(std::string_view s);

} // namespace fmsim
