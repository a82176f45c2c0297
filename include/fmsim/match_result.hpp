#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <fmsim/events.hpp>
#include <fmsim/trace.hpp>

namespace fmsim {

struct Score {
  int home{0};
  int away{0};

  int for_side(TeamSide s) const { return s == TeamSide::Home ? home : away; }
  // > 0 when `s` leads.
  int diff_for(TeamSide s) const { return s == TeamSide::Home ? home - away : away - home; }
  bool operator==(const Score&) const = default;
};

struct MatchResult {
  std::string home_name;
  std::string away_name;
  std::uint64_t seed{0};
  std::uint64_t ticks_played{0};
  Score score{};
  std::vector<MatchEvent> events;
  MatchStats stats{};
  std::optional<PositionTrace> trace{};
};

} // namespace fmsim
