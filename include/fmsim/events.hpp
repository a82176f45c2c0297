#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include <fmsim/ball.hpp>
#include <fmsim/coord.hpp>

namespace fmsim {

enum class EventKind : std::uint8_t {
  KickOff,
  Pass,
  PassCompleted,
  Interception,
  Cross,
  Shot,
  ShotOnTarget,
  Goal,
  Save,
  Tackle,
  Foul,
  YellowCard,
  RedCard,
  Offside,
  ThrowIn,
  GoalKick,
  Corner,
  HalfTime,
  FullTime,
};

inline constexpr int kEventKindCount = 19;

const char* to_string(EventKind k);
std::optional<EventKind> event_kind_from_string(std::string_view s);

// One timestamped, team/player tagged match event.
struct MatchEvent {
  std::uint64_t tick{0};
  int minute{0};
  EventKind kind{EventKind::KickOff};
  TeamSide team{TeamSide::Home};
  std::optional<PlayerIndex> player{};
  std::optional<PlayerIndex> other{};   // receiver, tackled player, fouled player, keeper
  Coord10 pos{};

  bool operator==(const MatchEvent&) const = default;
};

struct TeamStats {
  int goals{0};
  int shots{0};
  int shots_on_target{0};
  int passes_attempted{0};
  int passes_completed{0};
  int crosses{0};
  int tackles{0};
  int interceptions{0};
  int fouls{0};
  int corners{0};
  int saves{0};
  int offsides{0};
  int yellow_cards{0};
  int red_cards{0};
  std::uint64_t possession_ticks{0};
};

struct PlayerStats {
  int touches{0};
  int passes_attempted{0};
  int passes_completed{0};
  int shots{0};
  int goals{0};
  int tackles{0};
  double distance_m{0.0};
};

struct MatchStats {
  std::array<TeamStats, 2> teams{};
  std::array<PlayerStats, kPlayerCount> players{};

  const TeamStats& team(TeamSide s) const { return teams[static_cast<int>(s)]; }
  TeamStats& team(TeamSide s) { return teams[static_cast<int>(s)]; }
  const PlayerStats* player(PlayerIndex idx) const {
    if (idx < 0 || idx >= kPlayerCount) return nullptr;
    return &players[idx];
  }

  // Share of possession ticks, 0.5 before anyone had the ball.
  double possession_share(TeamSide s) const;
  double pass_accuracy(TeamSide s) const;
};

// Accumulates statistics from the event stream and per-tick samples.
class StatsSink {
public:
  void record(const MatchEvent& e);
  void possession_tick(std::optional<TeamSide> team);
  void touch(PlayerIndex idx);
  void distance(PlayerIndex idx, double meters);

  const MatchStats& stats() const { return stats_; }
  void clear() { stats_ = MatchStats{}; }

private:
  PlayerStats* player_(const std::optional<PlayerIndex>& idx);
  MatchStats stats_{};
};

// Count of events of one kind, optionally for one team.
std::size_t count_events(const std::vector<MatchEvent>& events, EventKind kind,
                         std::optional<TeamSide> team = std::nullopt);

} // namespace fmsim
