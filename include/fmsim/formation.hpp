#pragma once
#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <fmsim/coord.hpp>

namespace fmsim {

enum class PositionKey : std::uint8_t {
  GK, LB, LCB, CB, RCB, RB, LWB, RWB, CDM, LDM, RDM,
  LM, LCM, CM, RCM, RM, LAM, CAM, RAM, LW, RW, LF, CF, RF, ST
};

enum class PositionRole : std::uint8_t { Goalkeeper, Defender, Midfielder, Forward };

PositionRole role_of(PositionKey key);
const char* to_string(PositionKey key);
const char* to_string(PositionRole role);
std::optional<PositionKey> position_key_from_string(std::string_view s);

// Team-view anchor points for one slot.
struct Waypoints {
  NormPos base{};
  NormPos defensive{};   // deeper
  NormPos offensive{};   // higher
  NormPos left_shift{};
  NormPos right_shift{};

  static Waypoints from_base(NormPos base, double depth_offset, double width_offset);
};

struct FormationSlot {
  PositionKey key{PositionKey::GK};
  Waypoints wp{};
};

struct Formation {
  std::string key;                      // canonical, e.g. "442"
  std::array<FormationSlot, 11> slots{};

  const FormationSlot* slot(int idx) const {
    if (idx < 0 || idx >= static_cast<int>(slots.size())) return nullptr;
    return &slots[idx];
  }
  PositionRole role(int idx) const;
  int count_role(PositionRole r) const;
};

// Built-in catalog (16 shapes).
const std::vector<Formation>& formation_catalog();

// Accepts "4-4-2" or "442" style keys.
std::string canonical_formation_key(std::string_view key);
std::optional<Formation> formation_by_key(const std::string& key);
std::optional<Formation> formation_by_key_in(const std::vector<Formation>& cat, const std::string& key);

// Rows: formation,slot,position,base_width,base_length,depth_offset,width_offset
// A formation is kept only when slots 0..10 are all present and slot 0 is GK.
// Accepts an optional header row; ignores '#' comments and blank lines.
std::vector<Formation> formation_catalog_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Formation>> load_formation_catalog_csv(const std::string& path);

} // namespace fmsim
