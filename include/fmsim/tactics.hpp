#pragma once
#include <array>
#include <cstdint>
#include <fmsim/formation.hpp>

namespace fmsim {

enum class WidthInstruction : std::uint8_t { Normal, StayWide, CutInside, Roam };
enum class DepthInstruction : std::uint8_t { Balanced, GetForward, StayBack };

struct PlayerInstructions {
  WidthInstruction width{WidthInstruction::Normal};
  DepthInstruction depth{DepthInstruction::Balanced};
};

struct TeamInstructions {
  bool offside_trap{false};
  double pressing{0.5};        // 0..1, scales how many players may press
  std::array<PlayerInstructions, 11> players{};
};

enum class OffensiveGoal : std::uint8_t { MoveToBall, AttackGoal, FindSpace, SupportTeammate, HoldPosition };
enum class DefensiveGoal : std::uint8_t { PressOpponent, TrackBack, MarkPlayer, BlockPassingLane, HoldPosition };

// Either an offensive or a defensive goal, depending on possession.
struct TacticalGoal {
  bool offensive{true};
  OffensiveGoal off{OffensiveGoal::HoldPosition};
  DefensiveGoal def{DefensiveGoal::HoldPosition};

  static TacticalGoal attack(OffensiveGoal g) { return TacticalGoal{true, g, DefensiveGoal::HoldPosition}; }
  static TacticalGoal defend(DefensiveGoal g) { return TacticalGoal{false, OffensiveGoal::HoldPosition, g}; }
  bool operator==(const TacticalGoal&) const = default;
};

const char* to_string(OffensiveGoal g);
const char* to_string(DefensiveGoal g);

// Per-position weights, in enum order.
using GoalWeights = std::array<double, 5>;
GoalWeights offensive_bias(PositionKey key);
GoalWeights defensive_bias(PositionKey key);

// Attribute inputs used by goal selection (0..100).
struct GoalAttributes {
  double aggression{50}, work_rate{50}, off_the_ball{50}, finishing{50};
  double vision{50}, flair{50}, teamwork{50}, passing{50};
  double decisions{50}, positioning{50}, bravery{50}, pace{50};
  double marking{50}, strength{50}, concentration{50}, anticipation{50}, composure{50};
};

GoalWeights score_offensive_goals(PositionKey key, const GoalAttributes& a, bool is_user_player);
GoalWeights score_defensive_goals(PositionKey key, const GoalAttributes& a, double distance_to_ball_m);

// Highest score wins; ties go to the earlier entry of the fixed priority
// order (offensive: AttackGoal, FindSpace, SupportTeammate, MoveToBall, HoldPosition).
OffensiveGoal select_offensive_goal(const GoalWeights& scores);
// Defensive priority: PressOpponent, MarkPlayer, BlockPassingLane, TrackBack, HoldPosition.
DefensiveGoal select_defensive_goal(const GoalWeights& scores);

// Best defensive goal other than PressOpponent (used when the press quota is full).
DefensiveGoal select_defensive_goal_without_press(const GoalWeights& scores);

} // namespace fmsim
