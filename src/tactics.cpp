#include <fmsim/tactics.hpp>
#include <algorithm>

namespace fmsim {

const char* to_string(OffensiveGoal g) {
  switch (g) {
    case OffensiveGoal::MoveToBall:      return "move_to_ball";
    case OffensiveGoal::AttackGoal:      return "attack_goal";
    case OffensiveGoal::FindSpace:       return "find_space";
    case OffensiveGoal::SupportTeammate: return "support_teammate";
    case OffensiveGoal::HoldPosition:    return "hold_position";
  }
  return "?";
}

const char* to_string(DefensiveGoal g) {
  switch (g) {
    case DefensiveGoal::PressOpponent:    return "press_opponent";
    case DefensiveGoal::TrackBack:        return "track_back";
    case DefensiveGoal::MarkPlayer:       return "mark_player";
    case DefensiveGoal::BlockPassingLane: return "block_passing_lane";
    case DefensiveGoal::HoldPosition:     return "hold_position";
  }
  return "?";
}

// Offensive: ball, goal, space, support, hold.
GoalWeights offensive_bias(PositionKey key) {
  switch (key) {
    case PositionKey::ST: case PositionKey::CF: case PositionKey::LF: case PositionKey::RF:
      return {1.2, 3.0, 2.0, 0.8, 0.1};
    case PositionKey::LW: case PositionKey::RW:
      return {1.0, 1.5, 2.5, 1.5, 0.5};
    case PositionKey::CAM: case PositionKey::LAM: case PositionKey::RAM:
      return {1.5, 1.2, 2.0, 2.0, 0.5};
    case PositionKey::CM: case PositionKey::LCM: case PositionKey::RCM:
    case PositionKey::CDM: case PositionKey::LDM: case PositionKey::RDM:
      return {1.5, 0.5, 1.0, 3.0, 2.0};
    case PositionKey::LM: case PositionKey::RM:
      return {1.2, 1.0, 2.0, 2.0, 1.0};
    case PositionKey::LB: case PositionKey::RB: case PositionKey::LWB: case PositionKey::RWB:
      return {0.5, 0.2, 1.0, 2.0, 3.0};
    case PositionKey::CB: case PositionKey::LCB: case PositionKey::RCB:
      return {0.2, 0.1, 0.5, 1.5, 4.0};
    case PositionKey::GK:
      return {0.0, 0.0, 0.0, 1.0, 10.0};
  }
  return {1.5, 0.8, 1.5, 2.5, 1.5};
}

// Defensive: press, track, mark, block, hold.
GoalWeights defensive_bias(PositionKey key) {
  switch (key) {
    case PositionKey::ST: case PositionKey::CF: case PositionKey::LF: case PositionKey::RF:
      return {2.5, 0.5, 0.5, 1.5, 1.0};
    case PositionKey::LW: case PositionKey::RW:
      return {1.5, 1.5, 1.0, 1.5, 1.0};
    case PositionKey::CAM: case PositionKey::LAM: case PositionKey::RAM:
      return {1.5, 2.0, 1.5, 2.0, 1.5};
    case PositionKey::CM: case PositionKey::LCM: case PositionKey::RCM:
      return {2.0, 2.0, 2.0, 2.5, 2.0};
    case PositionKey::CDM: case PositionKey::LDM: case PositionKey::RDM:
      return {1.5, 1.5, 2.5, 3.0, 3.0};
    case PositionKey::LM: case PositionKey::RM:
      return {1.5, 2.5, 2.0, 2.0, 2.0};
    case PositionKey::LB: case PositionKey::RB: case PositionKey::LWB: case PositionKey::RWB:
      return {1.0, 1.0, 3.0, 2.5, 3.5};
    case PositionKey::CB: case PositionKey::LCB: case PositionKey::RCB:
      return {0.8, 0.5, 3.0, 3.0, 4.0};
    case PositionKey::GK:
      return {0.0, 0.0, 0.0, 0.0, 10.0};
  }
  return {1.8, 2.0, 2.0, 2.3, 2.0};
}

GoalWeights score_offensive_goals(PositionKey key, const GoalAttributes& a, bool is_user_player) {
  const GoalWeights w = offensive_bias(key);
  GoalWeights s{};
  s[0] = (a.aggression * 0.5 + a.work_rate * 0.5) * w[0];
  s[1] = (a.off_the_ball * 0.5 + a.aggression * 0.3 + a.finishing * 0.2) * w[1];
  s[2] = (a.vision * 0.3 + a.off_the_ball * 0.4 + a.flair * 0.3) * w[2];
  s[3] = (a.teamwork * 0.4 + a.vision * 0.3 + a.passing * 0.3) * w[3];
  s[4] = (a.decisions * 0.4 + a.positioning * 0.4 + (100.0 - a.aggression) * 0.2) * w[4];
  if (is_user_player) {
    s[0] *= 1.5;
    s[1] *= 1.2;
    s[4] *= 0.5;
  }
  return s;
}

GoalWeights score_defensive_goals(PositionKey key, const GoalAttributes& a, double distance_to_ball_m) {
  const GoalWeights w = defensive_bias(key);
  const double df = distance_to_ball_m < 10.0 ? 2.5 : (distance_to_ball_m < 20.0 ? 1.5 : 1.0);
  GoalWeights s{};
  s[0] = (a.aggression * 0.5 + a.bravery * 0.3 + a.work_rate * 0.2) * w[0] * df;
  s[1] = (a.work_rate * 0.4 + a.teamwork * 0.4 + a.pace * 0.2) * w[1];
  s[2] = (a.marking * 0.5 + a.strength * 0.3 + a.concentration * 0.2) * w[2];
  s[3] = (a.anticipation * 0.5 + a.positioning * 0.5) * w[3];
  s[4] = (a.positioning * 0.4 + a.composure * 0.3 + a.concentration * 0.3) * w[4];
  return s;
}

template <typename E, std::size_t N>
static E pick_by_priority(const GoalWeights& scores, const std::array<E, N>& order) {
  E best = order[0];
  double best_score = scores[static_cast<std::size_t>(order[0])];
  for (std::size_t i = 1; i < N; ++i) {
    const double s = scores[static_cast<std::size_t>(order[i])];
    if (s > best_score) { best = order[i]; best_score = s; }
  }
  return best;
}

OffensiveGoal select_offensive_goal(const GoalWeights& scores) {
  static constexpr std::array<OffensiveGoal, 5> kOrder = {
    OffensiveGoal::AttackGoal, OffensiveGoal::FindSpace, OffensiveGoal::SupportTeammate,
    OffensiveGoal::MoveToBall, OffensiveGoal::HoldPosition};
  return pick_by_priority(scores, kOrder);
}

DefensiveGoal select_defensive_goal(const GoalWeights& scores) {
  static constexpr std::array<DefensiveGoal, 5> kOrder = {
    DefensiveGoal::PressOpponent, DefensiveGoal::MarkPlayer, DefensiveGoal::BlockPassingLane,
    DefensiveGoal::TrackBack, DefensiveGoal::HoldPosition};
  return pick_by_priority(scores, kOrder);
}

DefensiveGoal select_defensive_goal_without_press(const GoalWeights& scores) {
  static constexpr std::array<DefensiveGoal, 4> kOrder = {
    DefensiveGoal::MarkPlayer, DefensiveGoal::BlockPassingLane,
    DefensiveGoal::TrackBack, DefensiveGoal::HoldPosition};
  return pick_by_priority(scores, kOrder);
}

} // namespace fmsim
