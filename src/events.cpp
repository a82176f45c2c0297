#include <fmsim/events.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include "csv_util.hpp"

namespace fmsim {

namespace {
struct KindName { EventKind kind; const char* name; };

constexpr std::array<KindName, kEventKindCount> kKindNames{{
  {EventKind::KickOff,       "kickoff"},
  {EventKind::Pass,          "pass"},
  {EventKind::PassCompleted, "pass_completed"},
  {EventKind::Interception,  "interception"},
  {EventKind::Cross,         "cross"},
  {EventKind::Shot,          "shot"},
  {EventKind::ShotOnTarget,  "shot_on_target"},
  {EventKind::Goal,          "goal"},
  {EventKind::Save,          "save"},
  {EventKind::Tackle,        "tackle"},
  {EventKind::Foul,          "foul"},
  {EventKind::YellowCard,    "yellow_card"},
  {EventKind::RedCard,       "red_card"},
  {EventKind::Offside,       "offside"},
  {EventKind::ThrowIn,       "throw_in"},
  {EventKind::GoalKick,      "goal_kick"},
  {EventKind::Corner,        "corner"},
  {EventKind::HalfTime,      "half_time"},
  {EventKind::FullTime,      "full_time"},
}};
} // namespace

const char* to_string(EventKind k) {
  for (const auto& kn : kKindNames) {
    if (kn.kind == k) return kn.name;
  }
  return "?";
}

std::optional<EventKind> event_kind_from_string(std::string_view s) {
  std::string v = detail::lower(detail::trim(std::string(s)));
  std::replace(v.begin(), v.end(), '-', '_');
  std::replace(v.begin(), v.end(), ' ', '_');
  for (const auto& kn : kKindNames) {
    if (v == kn.name) return kn.kind;
  }
  return std::nullopt;
}

double MatchStats::possession_share(TeamSide s) const {
  const double h = double(teams[0].possession_ticks);
  const double a = double(teams[1].possession_ticks);
  if (h + a <= 0.0) return 0.5;
  return (s == TeamSide::Home ? h : a) / (h + a);
}

double MatchStats::pass_accuracy(TeamSide s) const {
  const auto& t = team(s);
  if (t.passes_attempted <= 0) return 0.0;
  return double(t.passes_completed) / double(t.passes_attempted);
}

PlayerStats* StatsSink::player_(const std::optional<PlayerIndex>& idx) {
  if (!idx || *idx < 0 || *idx >= kPlayerCount) return nullptr;
  return &stats_.players[*idx];
}

void StatsSink::record(const MatchEvent& e) {
  TeamStats& t = stats_.team(e.team);
  PlayerStats* p = player_(e.player);
  switch (e.kind) {
    case EventKind::Pass:
      ++t.passes_attempted;
      if (p) ++p->passes_attempted;
      break;
    case EventKind::PassCompleted:
      ++t.passes_completed;
      if (p) ++p->passes_completed;
      break;
    case EventKind::Interception:
      ++t.interceptions;
      break;
    case EventKind::Cross:
      ++t.crosses;
      break;
    case EventKind::Shot:
      ++t.shots;
      if (p) ++p->shots;
      break;
    case EventKind::ShotOnTarget:
      ++t.shots_on_target;
      break;
    case EventKind::Goal:
      ++t.goals;
      if (p) ++p->goals;
      break;
    case EventKind::Save:
      ++t.saves;
      break;
    case EventKind::Tackle:
      ++t.tackles;
      if (p) ++p->tackles;
      break;
    case EventKind::Foul:
      ++t.fouls;
      break;
    case EventKind::YellowCard:
      ++t.yellow_cards;
      break;
    case EventKind::RedCard:
      ++t.red_cards;
      break;
    case EventKind::Offside:
      ++t.offsides;
      break;
    case EventKind::Corner:
      ++t.corners;
      break;
    case EventKind::KickOff:
    case EventKind::ThrowIn:
    case EventKind::GoalKick:
    case EventKind::HalfTime:
    case EventKind::FullTime:
      break;
  }
}

void StatsSink::possession_tick(std::optional<TeamSide> team) {
  if (team) ++stats_.team(*team).possession_ticks;
}

void StatsSink::touch(PlayerIndex idx) {
  if (auto* p = player_(idx)) ++p->touches;
}

void StatsSink::distance(PlayerIndex idx, double meters) {
  if (!std::isfinite(meters) || meters <= 0.0) return;
  if (auto* p = player_(idx)) p->distance_m += meters;
}

std::size_t count_events(const std::vector<MatchEvent>& events, EventKind kind, std::optional<TeamSide> team) {
  return static_cast<std::size_t>(std::count_if(events.begin(), events.end(), [&](const MatchEvent& e) {
    return e.kind == kind && (!team || e.team == *team);
  }));
}

} // namespace fmsim
