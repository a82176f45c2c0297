#pragma once
#include <cstdint>
#include <optional>
#include <vector>
#include <fmsim/ball.hpp>
#include <fmsim/coord.hpp>

namespace fmsim {

enum class ScheduledKind : std::uint8_t { Pass, Shot, Cross, Tackle, Save, Dribble };

const char* to_string(ScheduledKind k);

// Kick parameters carried by a pending action.
struct ActionPayload {
  double speed_mps{0.0};
  HeightProfile profile{HeightProfile::Flat};
  double curve{0.0};
  std::optional<PlayerIndex> receiver{};
};

struct ScheduledAction {
  std::uint64_t id{0};
  ScheduledKind kind{ScheduledKind::Pass};
  PlayerIndex player{0};
  std::uint64_t start_tick{0};
  std::uint64_t complete_tick{0};
  Coord10 target{};
  ActionPayload payload{};
};

// Pending actions, at most one per player. Due actions pop in
// (complete_tick, id) order.
class ActionQueue {
public:
  // Returns the id, or nullopt if the player already has an action or the
  // completion tick precedes the start tick.
  std::optional<std::uint64_t> schedule(ScheduledKind kind, PlayerIndex player,
                                        std::uint64_t start_tick, std::uint64_t complete_tick,
                                        const Coord10& target, const ActionPayload& payload = {});

  bool cancel(std::uint64_t id);
  bool cancel_for(PlayerIndex player);
  void clear() { pending_.clear(); }

  const ScheduledAction* active_for(PlayerIndex player) const;
  bool has_active(PlayerIndex player) const { return active_for(player) != nullptr; }

  // Removes and returns every action with complete_tick <= tick.
  std::vector<ScheduledAction> pop_due(std::uint64_t tick);

  std::size_t size() const { return pending_.size(); }
  bool empty() const { return pending_.empty(); }

private:
  std::vector<ScheduledAction> pending_;
  std::uint64_t next_id_{1};
};

} // namespace fmsim
