#include <fmsim/action_queue.hpp>
#include <algorithm>

namespace fmsim {

const char* to_string(ScheduledKind k) {
  switch (k) {
    case ScheduledKind::Pass:    return "pass";
    case ScheduledKind::Shot:    return "shot";
    case ScheduledKind::Cross:   return "cross";
    case ScheduledKind::Tackle:  return "tackle";
    case ScheduledKind::Save:    return "save";
    case ScheduledKind::Dribble: return "dribble";
  }
  return "?";
}

std::optional<std::uint64_t> ActionQueue::schedule(ScheduledKind kind, PlayerIndex player,
                                                   std::uint64_t start_tick, std::uint64_t complete_tick,
                                                   const Coord10& target, const ActionPayload& payload) {
  if (complete_tick < start_tick) return std::nullopt;
  if (has_active(player)) return std::nullopt;
  ScheduledAction a;
  a.id = next_id_++;
  a.kind = kind;
  a.player = player;
  a.start_tick = start_tick;
  a.complete_tick = complete_tick;
  a.target = target;
  a.payload = payload;
  pending_.push_back(a);
  return a.id;
}

bool ActionQueue::cancel(std::uint64_t id) {
  auto it = std::find_if(pending_.begin(), pending_.end(), [&](const ScheduledAction& a) { return a.id == id; });
  if (it == pending_.end()) return false;
  pending_.erase(it);
  return true;
}

bool ActionQueue::cancel_for(PlayerIndex player) {
  auto it = std::find_if(pending_.begin(), pending_.end(), [&](const ScheduledAction& a) { return a.player == player; });
  if (it == pending_.end()) return false;
  pending_.erase(it);
  return true;
}

const ScheduledAction* ActionQueue::active_for(PlayerIndex player) const {
  for (const auto& a : pending_) {
    if (a.player == player) return &a;
  }
  return nullptr;
}

std::vector<ScheduledAction> ActionQueue::pop_due(std::uint64_t tick) {
  std::vector<ScheduledAction> due;
  auto split = std::stable_partition(pending_.begin(), pending_.end(),
                                     [&](const ScheduledAction& a) { return a.complete_tick > tick; });
  due.assign(split, pending_.end());
  pending_.erase(split, pending_.end());
  std::sort(due.begin(), due.end(), [](const ScheduledAction& a, const ScheduledAction& b) {
    if (a.complete_tick != b.complete_tick) return a.complete_tick < b.complete_tick;
    return a.id < b.id;
  });
  return due;
}

} // namespace fmsim
