#include <fmsim/ownership.hpp>
#include <algorithm>
#include <cmath>

namespace fmsim {

double contest_score(const ContestPlayer& p, const OwnershipParams& params) {
  double s = p.tackling * 0.4 + p.aggression * 0.2 + p.bravery * 0.1 + p.strength * 0.2 + p.agility * 0.1;
  if (team_of(p.idx) == TeamSide::Home) s *= (1.0 + params.home_advantage);
  if (p.is_hero) s += params.hero_bonus;
  return std::isfinite(s) ? s : 0.0;
}

// splitmix64 finalizer
static std::uint64_t mix64(std::uint64_t z) {
  z += 0x9E3779B97F4A7C15ull;
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
  return z ^ (z >> 31);
}

std::uint64_t tie_break_hash(PlayerIndex idx, const Coord10& pos) {
  const auto dm = [](std::int32_t u) {
    return static_cast<std::uint64_t>(static_cast<std::uint32_t>(static_cast<std::int32_t>(std::lround(double(u) / 100.0))));
  };
  std::uint64_t h = mix64(static_cast<std::uint64_t>(idx));
  h = mix64(h ^ dm(pos.x));
  h = mix64(h ^ (dm(pos.y) << 1));
  return h;
}

bool candidate_precedes(const OwnershipCandidate& a, const OwnershipCandidate& b) {
  if (a.score != b.score) return a.score > b.score;
  if (a.distance_m != b.distance_m) return a.distance_m < b.distance_m;
  if (a.tie != b.tie) return a.tie > b.tie;
  return a.idx < b.idx;   // only for identical hashes
}

std::vector<OwnershipCandidate> collect_candidates(const Ball& ball,
                                                   const std::vector<ContestPlayer>& players,
                                                   const OwnershipParams& params) {
  std::vector<OwnershipCandidate> out;
  const double h = ball.height_m();
  if (h > params.gk_catch_max_m) return out;

  for (const auto& p : players) {
    if (!p.eligible) continue;
    if (h > params.header_max_m && !p.is_goalkeeper) continue;
    const double d = p.pos.distance_to_m(ball.pos);
    if (d >= params.threshold_m) continue;
    out.push_back(OwnershipCandidate{p.idx, contest_score(p, params), d, tie_break_hash(p.idx, p.pos)});
  }
  return out;
}

OwnershipDecision resolve_ownership(const Ball& ball,
                                    const std::vector<ContestPlayer>& players,
                                    const OwnershipParams& params) {
  OwnershipDecision dec;
  dec.from = ball.current_owner;
  const auto cands = collect_candidates(ball, players, params);

  if (ball.current_owner) {
    const PlayerIndex owner = *ball.current_owner;
    const bool support = std::any_of(cands.begin(), cands.end(), [&](const OwnershipCandidate& c) {
      return c.idx != owner && team_of(c.idx) == team_of(owner);
    });
    if (support || cands.empty()) {
      dec.change = OwnershipChange::Retained;
      dec.owner = owner;
      return dec;
    }
  }
  if (cands.empty()) return dec;

  const auto best = std::min_element(cands.begin(), cands.end(), candidate_precedes);
  dec.owner = best->idx;
  if (!ball.current_owner) {
    dec.change = OwnershipChange::Pickup;
  } else if (*ball.current_owner == best->idx) {
    dec.change = OwnershipChange::Retained;
  } else {
    dec.change = OwnershipChange::CrossTeamTransfer;
  }
  return dec;
}

void assign_ownership(Ball& ball, PlayerIndex owner, const Coord10& owner_pos) {
  if (ball.current_owner != owner) {
    if (ball.current_owner) ball.previous_owner = ball.current_owner;
    ball.current_owner = owner;
  }
  ball.pos = Coord10{owner_pos.x, owner_pos.y, 0}.clamped_to_field();
  ball.vel = {};
  ball.vz = 0;
  ball.spin = {};
  ball.curve_factor = 0.0;
  ball.bounce_count = 0;
  ball.phase = BallPhase::Rolling;
}

const char* to_string(OwnershipChange c) {
  switch (c) {
    case OwnershipChange::None:              return "none";
    case OwnershipChange::Retained:          return "retained";
    case OwnershipChange::Pickup:            return "pickup";
    case OwnershipChange::CrossTeamTransfer: return "cross_team_transfer";
  }
  return "?";
}

} // namespace fmsim
