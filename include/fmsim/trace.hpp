#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <vector>
#include <fmsim/ball.hpp>
#include <fmsim/coord.hpp>

namespace fmsim {

// World state sample taken at the end of one tick.
struct TickFrame {
  std::uint64_t tick = 0;             // sim tick index
  Coord10 ball{};                     // z = ball height
  std::optional<PlayerIndex> owner{};
  std::array<Coord10, kPlayerCount> players{};

  bool operator==(const TickFrame&) const = default;
};

struct PositionTrace {
  std::vector<TickFrame> frames;

  // nullptr if the tick was not recorded.
  const TickFrame* frame_at(std::uint64_t tick) const {
    if (frames.empty() || tick < frames.front().tick) return nullptr;
    const std::uint64_t off = tick - frames.front().tick;
    if (off >= frames.size()) return nullptr;
    const TickFrame& f = frames[static_cast<std::size_t>(off)];
    return f.tick == tick ? &f : nullptr;
  }
  const TickFrame* last() const { return frames.empty() ? nullptr : &frames.back(); }
  bool operator==(const PositionTrace&) const = default;
};

} // namespace fmsim
