#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <fmsim/ball.hpp>
#include <fmsim/config.hpp>

namespace fmsim {

struct OwnershipParams {
  double threshold_m{5.0};
  double header_max_m{2.9};
  double gk_catch_max_m{3.3};
  double home_advantage{0.04};
  double hero_bonus{0.2};

  static OwnershipParams from_config(const EngineConfig& c) {
    return OwnershipParams{c.ownership_threshold_m, c.header_max_m, c.gk_catch_max_m, c.home_advantage, c.hero_bonus};
  }
};

// What the resolver needs to know about one player.
struct ContestPlayer {
  PlayerIndex idx{0};
  Coord10 pos{};
  double tackling{50}, aggression{50}, bravery{50}, strength{50}, agility{50};
  bool is_goalkeeper{false};
  bool is_hero{false};
  bool eligible{true};   // false: sent off, or just kicked the ball
};

struct OwnershipCandidate {
  PlayerIndex idx{0};
  double score{0.0};
  double distance_m{0.0};
  std::uint64_t tie{0};
};

// tackling*0.4 + aggression*0.2 + bravery*0.1 + strength*0.2 + agility*0.1,
// home side scaled by (1 + home_advantage), hero +hero_bonus.
double contest_score(const ContestPlayer& p, const OwnershipParams& params);

// Order-independent tie key from the index and the position rounded to 0.1 m.
std::uint64_t tie_break_hash(PlayerIndex idx, const Coord10& pos);

// Strict ordering: higher score, then closer, then larger hash.
bool candidate_precedes(const OwnershipCandidate& a, const OwnershipCandidate& b);

// Players close enough to claim the ball at its current height.
std::vector<OwnershipCandidate> collect_candidates(const Ball& ball,
                                                   const std::vector<ContestPlayer>& players,
                                                   const OwnershipParams& params);

// The ball only changes team through a contest; teammates get it by a pass.
enum class OwnershipChange : std::uint8_t { None, Retained, Pickup, CrossTeamTransfer };

struct OwnershipDecision {
  OwnershipChange change{OwnershipChange::None};
  std::optional<PlayerIndex> owner{};
  std::optional<PlayerIndex> from{};
};

// Decide who has the ball. Does not modify the ball.
OwnershipDecision resolve_ownership(const Ball& ball,
                                    const std::vector<ContestPlayer>& players,
                                    const OwnershipParams& params);

// Hand the ball to `owner`: it snaps to the owner's spot and stops.
void assign_ownership(Ball& ball, PlayerIndex owner, const Coord10& owner_pos);

const char* to_string(OwnershipChange c);

} // namespace fmsim
