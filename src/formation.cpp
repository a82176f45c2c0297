#include <fmsim/formation.hpp>
#include <algorithm>
#include <fstream>
#include <map>
#include "csv_util.hpp"

namespace fmsim {

PositionRole role_of(PositionKey key) {
  switch (key) {
    case PositionKey::GK:
      return PositionRole::Goalkeeper;
    case PositionKey::LB: case PositionKey::LCB: case PositionKey::CB: case PositionKey::RCB:
    case PositionKey::RB: case PositionKey::LWB: case PositionKey::RWB: case PositionKey::CDM:
    case PositionKey::LDM: case PositionKey::RDM:
      return PositionRole::Defender;
    case PositionKey::LM: case PositionKey::LCM: case PositionKey::CM: case PositionKey::RCM:
    case PositionKey::RM: case PositionKey::LAM: case PositionKey::CAM: case PositionKey::RAM:
      return PositionRole::Midfielder;
    case PositionKey::LW: case PositionKey::RW: case PositionKey::LF: case PositionKey::CF:
    case PositionKey::RF: case PositionKey::ST:
      return PositionRole::Forward;
  }
  return PositionRole::Midfielder;
}

static constexpr std::array<const char*, 25> kKeyNames = {
  "GK", "LB", "LCB", "CB", "RCB", "RB", "LWB", "RWB", "CDM", "LDM", "RDM",
  "LM", "LCM", "CM", "RCM", "RM", "LAM", "CAM", "RAM", "LW", "RW", "LF", "CF", "RF", "ST"
};

const char* to_string(PositionKey key) {
  const auto i = static_cast<std::size_t>(key);
  return i < kKeyNames.size() ? kKeyNames[i] : "?";
}

const char* to_string(PositionRole role) {
  switch (role) {
    case PositionRole::Goalkeeper: return "goalkeeper";
    case PositionRole::Defender:   return "defender";
    case PositionRole::Midfielder: return "midfielder";
    case PositionRole::Forward:    return "forward";
  }
  return "?";
}

std::optional<PositionKey> position_key_from_string(std::string_view s) {
  std::string up(s);
  for (auto& c : up) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  for (std::size_t i = 0; i < kKeyNames.size(); ++i) {
    if (up == kKeyNames[i]) return static_cast<PositionKey>(i);
  }
  return std::nullopt;
}

Waypoints Waypoints::from_base(NormPos base, double depth_offset, double width_offset) {
  Waypoints w;
  w.base        = base;
  w.defensive   = {base.width, std::max(0.05, base.length - depth_offset)};
  w.offensive   = {base.width, std::min(0.95, base.length + depth_offset)};
  w.left_shift  = {std::max(0.05, base.width - width_offset), base.length};
  w.right_shift = {std::min(0.95, base.width + width_offset), base.length};
  return w;
}

PositionRole Formation::role(int idx) const {
  const auto* s = slot(idx);
  return s ? role_of(s->key) : PositionRole::Midfielder;
}

int Formation::count_role(PositionRole r) const {
  return static_cast<int>(std::count_if(slots.begin(), slots.end(),
                                        [&](const FormationSlot& s){ return role_of(s.key) == r; }));
}

namespace {

struct SlotRow {
  const char* formation;
  PositionKey key;
  double base_width;
  double base_length;
  double depth_offset;
  double width_offset;
};

// Slots listed in order 0..10 per formation: keeper, back line left to right,
// midfield, attack.
constexpr SlotRow kBuiltinRows[] = {
    {"442", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"442", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"442", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"442", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"442", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"442", PositionKey::LM, 0.15, 0.50, 0.12, 0.10},
    {"442", PositionKey::LCM, 0.35, 0.45, 0.10, 0.12},
    {"442", PositionKey::RCM, 0.65, 0.45, 0.10, 0.12},
    {"442", PositionKey::RM, 0.85, 0.50, 0.12, 0.10},
    {"442", PositionKey::LF, 0.35, 0.78, 0.10, 0.15},
    {"442", PositionKey::RF, 0.65, 0.78, 0.10, 0.15},
    {"433", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"433", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"433", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"433", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"433", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"433", PositionKey::LCM, 0.30, 0.45, 0.12, 0.12},
    {"433", PositionKey::CM, 0.50, 0.42, 0.10, 0.15},
    {"433", PositionKey::RCM, 0.70, 0.45, 0.12, 0.12},
    {"433", PositionKey::LW, 0.12, 0.75, 0.12, 0.08},
    {"433", PositionKey::ST, 0.50, 0.82, 0.10, 0.15},
    {"433", PositionKey::RW, 0.88, 0.75, 0.12, 0.08},
    {"4231", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"4231", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"4231", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"4231", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"4231", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"4231", PositionKey::LDM, 0.35, 0.38, 0.08, 0.12},
    {"4231", PositionKey::RDM, 0.65, 0.38, 0.08, 0.12},
    {"4231", PositionKey::LAM, 0.20, 0.62, 0.12, 0.10},
    {"4231", PositionKey::CAM, 0.50, 0.60, 0.12, 0.15},
    {"4231", PositionKey::RAM, 0.80, 0.62, 0.12, 0.10},
    {"4231", PositionKey::ST, 0.50, 0.82, 0.10, 0.15},
    {"352", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"352", PositionKey::LCB, 0.25, 0.20, 0.06, 0.10},
    {"352", PositionKey::CB, 0.50, 0.18, 0.05, 0.12},
    {"352", PositionKey::RCB, 0.75, 0.20, 0.06, 0.10},
    {"352", PositionKey::LWB, 0.10, 0.45, 0.15, 0.08},
    {"352", PositionKey::LCM, 0.30, 0.42, 0.10, 0.10},
    {"352", PositionKey::CM, 0.50, 0.40, 0.08, 0.12},
    {"352", PositionKey::RCM, 0.70, 0.42, 0.10, 0.10},
    {"352", PositionKey::RWB, 0.90, 0.45, 0.15, 0.08},
    {"352", PositionKey::LF, 0.35, 0.78, 0.10, 0.15},
    {"352", PositionKey::RF, 0.65, 0.78, 0.10, 0.15},
    {"442d", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"442d", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"442d", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"442d", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"442d", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"442d", PositionKey::CDM, 0.50, 0.35, 0.08, 0.12},
    {"442d", PositionKey::LCM, 0.30, 0.48, 0.10, 0.10},
    {"442d", PositionKey::RCM, 0.70, 0.48, 0.10, 0.10},
    {"442d", PositionKey::CAM, 0.50, 0.60, 0.12, 0.15},
    {"442d", PositionKey::LF, 0.35, 0.78, 0.10, 0.15},
    {"442d", PositionKey::RF, 0.65, 0.78, 0.10, 0.15},
    {"4141", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"4141", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"4141", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"4141", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"4141", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"4141", PositionKey::CDM, 0.50, 0.35, 0.08, 0.15},
    {"4141", PositionKey::LM, 0.15, 0.55, 0.12, 0.10},
    {"4141", PositionKey::LCM, 0.35, 0.52, 0.10, 0.12},
    {"4141", PositionKey::RCM, 0.65, 0.52, 0.10, 0.12},
    {"4141", PositionKey::RM, 0.85, 0.55, 0.12, 0.10},
    {"4141", PositionKey::ST, 0.50, 0.82, 0.10, 0.15},
    {"4411", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"4411", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"4411", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"4411", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"4411", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"4411", PositionKey::LM, 0.15, 0.48, 0.12, 0.10},
    {"4411", PositionKey::LCM, 0.35, 0.45, 0.10, 0.12},
    {"4411", PositionKey::RCM, 0.65, 0.45, 0.10, 0.12},
    {"4411", PositionKey::RM, 0.85, 0.48, 0.12, 0.10},
    {"4411", PositionKey::CF, 0.50, 0.68, 0.12, 0.15},
    {"4411", PositionKey::ST, 0.50, 0.82, 0.10, 0.15},
    {"4321", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"4321", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"4321", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"4321", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"4321", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"4321", PositionKey::LCM, 0.30, 0.45, 0.10, 0.12},
    {"4321", PositionKey::CM, 0.50, 0.42, 0.08, 0.15},
    {"4321", PositionKey::RCM, 0.70, 0.45, 0.10, 0.12},
    {"4321", PositionKey::LF, 0.40, 0.68, 0.12, 0.12},
    {"4321", PositionKey::RF, 0.60, 0.68, 0.12, 0.12},
    {"4321", PositionKey::ST, 0.50, 0.82, 0.10, 0.15},
    {"343", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"343", PositionKey::LCB, 0.25, 0.20, 0.06, 0.10},
    {"343", PositionKey::CB, 0.50, 0.18, 0.05, 0.12},
    {"343", PositionKey::RCB, 0.75, 0.20, 0.06, 0.10},
    {"343", PositionKey::LM, 0.15, 0.48, 0.15, 0.10},
    {"343", PositionKey::LCM, 0.35, 0.45, 0.10, 0.12},
    {"343", PositionKey::RCM, 0.65, 0.45, 0.10, 0.12},
    {"343", PositionKey::RM, 0.85, 0.48, 0.15, 0.10},
    {"343", PositionKey::LW, 0.15, 0.75, 0.12, 0.08},
    {"343", PositionKey::ST, 0.50, 0.82, 0.10, 0.15},
    {"343", PositionKey::RW, 0.85, 0.75, 0.12, 0.08},
    {"532", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"532", PositionKey::LWB, 0.10, 0.30, 0.12, 0.08},
    {"532", PositionKey::LCB, 0.28, 0.20, 0.06, 0.08},
    {"532", PositionKey::CB, 0.50, 0.18, 0.05, 0.10},
    {"532", PositionKey::RCB, 0.72, 0.20, 0.06, 0.08},
    {"532", PositionKey::RWB, 0.90, 0.30, 0.12, 0.08},
    {"532", PositionKey::LCM, 0.30, 0.45, 0.10, 0.12},
    {"532", PositionKey::CM, 0.50, 0.42, 0.08, 0.15},
    {"532", PositionKey::RCM, 0.70, 0.45, 0.10, 0.12},
    {"532", PositionKey::LF, 0.35, 0.78, 0.10, 0.15},
    {"532", PositionKey::RF, 0.65, 0.78, 0.10, 0.15},
    {"4312", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"4312", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"4312", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"4312", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"4312", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"4312", PositionKey::LCM, 0.30, 0.42, 0.10, 0.12},
    {"4312", PositionKey::CM, 0.50, 0.38, 0.08, 0.15},
    {"4312", PositionKey::RCM, 0.70, 0.42, 0.10, 0.12},
    {"4312", PositionKey::CAM, 0.50, 0.58, 0.12, 0.15},
    {"4312", PositionKey::LF, 0.35, 0.78, 0.10, 0.15},
    {"4312", PositionKey::RF, 0.65, 0.78, 0.10, 0.15},
    {"4222", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"4222", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"4222", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"4222", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"4222", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"4222", PositionKey::LDM, 0.35, 0.38, 0.08, 0.12},
    {"4222", PositionKey::RDM, 0.65, 0.38, 0.08, 0.12},
    {"4222", PositionKey::LAM, 0.30, 0.58, 0.12, 0.12},
    {"4222", PositionKey::RAM, 0.70, 0.58, 0.12, 0.12},
    {"4222", PositionKey::LF, 0.35, 0.78, 0.10, 0.15},
    {"4222", PositionKey::RF, 0.65, 0.78, 0.10, 0.15},
    {"541", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"541", PositionKey::LWB, 0.10, 0.28, 0.10, 0.08},
    {"541", PositionKey::LCB, 0.28, 0.20, 0.06, 0.08},
    {"541", PositionKey::CB, 0.50, 0.18, 0.05, 0.10},
    {"541", PositionKey::RCB, 0.72, 0.20, 0.06, 0.08},
    {"541", PositionKey::RWB, 0.90, 0.28, 0.10, 0.08},
    {"541", PositionKey::LM, 0.15, 0.48, 0.12, 0.10},
    {"541", PositionKey::LCM, 0.35, 0.45, 0.10, 0.12},
    {"541", PositionKey::RCM, 0.65, 0.45, 0.10, 0.12},
    {"541", PositionKey::RM, 0.85, 0.48, 0.12, 0.10},
    {"541", PositionKey::ST, 0.50, 0.80, 0.10, 0.15},
    {"451", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"451", PositionKey::LB, 0.15, 0.25, 0.08, 0.10},
    {"451", PositionKey::LCB, 0.35, 0.20, 0.06, 0.08},
    {"451", PositionKey::RCB, 0.65, 0.20, 0.06, 0.08},
    {"451", PositionKey::RB, 0.85, 0.25, 0.08, 0.10},
    {"451", PositionKey::LM, 0.12, 0.50, 0.12, 0.08},
    {"451", PositionKey::LCM, 0.30, 0.45, 0.10, 0.10},
    {"451", PositionKey::CM, 0.50, 0.42, 0.08, 0.12},
    {"451", PositionKey::RCM, 0.70, 0.45, 0.10, 0.10},
    {"451", PositionKey::RM, 0.88, 0.50, 0.12, 0.08},
    {"451", PositionKey::ST, 0.50, 0.82, 0.10, 0.15},
    {"3412", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"3412", PositionKey::LCB, 0.25, 0.20, 0.06, 0.10},
    {"3412", PositionKey::CB, 0.50, 0.18, 0.05, 0.12},
    {"3412", PositionKey::RCB, 0.75, 0.20, 0.06, 0.10},
    {"3412", PositionKey::LM, 0.12, 0.45, 0.15, 0.08},
    {"3412", PositionKey::LCM, 0.35, 0.42, 0.10, 0.10},
    {"3412", PositionKey::RCM, 0.65, 0.42, 0.10, 0.10},
    {"3412", PositionKey::RM, 0.88, 0.45, 0.15, 0.08},
    {"3412", PositionKey::CAM, 0.50, 0.60, 0.12, 0.15},
    {"3412", PositionKey::LF, 0.35, 0.78, 0.10, 0.15},
    {"3412", PositionKey::RF, 0.65, 0.78, 0.10, 0.15},
    {"3421", PositionKey::GK, 0.5, 0.04, 0.02, 0.08},
    {"3421", PositionKey::LCB, 0.25, 0.20, 0.06, 0.10},
    {"3421", PositionKey::CB, 0.50, 0.18, 0.05, 0.12},
    {"3421", PositionKey::RCB, 0.75, 0.20, 0.06, 0.10},
    {"3421", PositionKey::LM, 0.15, 0.48, 0.15, 0.10},
    {"3421", PositionKey::LCM, 0.40, 0.45, 0.10, 0.12},
    {"3421", PositionKey::RCM, 0.60, 0.45, 0.10, 0.12},
    {"3421", PositionKey::RM, 0.85, 0.48, 0.15, 0.10},
    {"3421", PositionKey::LAM, 0.35, 0.65, 0.12, 0.12},
    {"3421", PositionKey::RAM, 0.65, 0.65, 0.12, 0.12},
    {"3421", PositionKey::ST, 0.50, 0.82, 0.10, 0.15},
};

// Groups rows into formations in slot order; incomplete groups are dropped.
template <typename Rows>
std::vector<Formation> assemble(const Rows& rows) {
  std::vector<Formation> out;
  std::map<std::string, std::vector<std::pair<int, FormationSlot>>> groups;
  std::vector<std::string> order;
  for (const auto& r : rows) {
    auto& g = groups[r.first];
    if (g.empty()) order.push_back(r.first);
    g.push_back(r.second);
  }
  for (const auto& key : order) {
    const auto& g = groups[key];
    Formation f;
    f.key = key;
    std::array<bool, 11> seen{};
    bool ok = true;
    for (const auto& [idx, slot] : g) {
      if (idx < 0 || idx >= 11 || seen[idx]) { ok = false; break; }
      seen[idx] = true;
      f.slots[idx] = slot;
    }
    ok = ok && std::all_of(seen.begin(), seen.end(), [](bool b){ return b; });
    ok = ok && f.slots[0].key == PositionKey::GK && f.count_role(PositionRole::Goalkeeper) == 1;
    if (ok) out.push_back(std::move(f));
  }
  return out;
}

std::vector<Formation> make_catalog_builtin() {
  std::vector<std::pair<std::string, std::pair<int, FormationSlot>>> rows;
  std::map<std::string, int> next_slot;
  for (const auto& r : kBuiltinRows) {
    const int idx = next_slot[r.formation]++;
    FormationSlot s{r.key, Waypoints::from_base({r.base_width, r.base_length}, r.depth_offset, r.width_offset)};
    rows.push_back({r.formation, {idx, s}});
  }
  return assemble(rows);
}

} // namespace

const std::vector<Formation>& formation_catalog() {
  static const std::vector<Formation> cat = make_catalog_builtin();
  return cat;
}

std::string canonical_formation_key(std::string_view key) {
  std::string out;
  for (char c : key) {
    if (c == '-' || std::isspace(static_cast<unsigned char>(c))) continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (out == "442diamond") out = "442d";
  return out;
}

std::optional<Formation> formation_by_key(const std::string& key) {
  return formation_by_key_in(formation_catalog(), key);
}

std::optional<Formation> formation_by_key_in(const std::vector<Formation>& cat, const std::string& key) {
  const std::string k = canonical_formation_key(key);
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Formation& f){ return f.key == k; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<Formation> formation_catalog_from_csv_stream(std::istream& in) {
  std::vector<std::pair<std::string, std::pair<int, FormationSlot>>> rows;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = detail::trim(line);
    if (detail::is_skippable(raw)) continue;
    const auto cols = detail::split_csv_line(raw);
    if (cols.size() < 7) continue;

    if (!header_consumed && detail::lower(cols[0]) == "formation") {
      header_consumed = true;
      continue;
    }

    bool ok_slot = false, ok_w = false, ok_l = false, ok_d = false, ok_x = false;
    const int slot = detail::to_int_safe(cols[1], ok_slot);
    const auto key = position_key_from_string(cols[2]);
    const double bw = detail::to_double_safe(cols[3], ok_w);
    const double bl = detail::to_double_safe(cols[4], ok_l);
    const double dof = detail::to_double_safe(cols[5], ok_d);
    const double wof = detail::to_double_safe(cols[6], ok_x);
    if (cols[0].empty() || !key || !(ok_slot && ok_w && ok_l && ok_d && ok_x)) continue;

    const NormPos base = clamp_norm({bw, bl}, 0.0, 1.0);
    FormationSlot s{*key, Waypoints::from_base(base, std::max(0.0, dof), std::max(0.0, wof))};
    rows.push_back({canonical_formation_key(cols[0]), {slot, s}});
  }
  return assemble(rows);
}

std::optional<std::vector<Formation>> load_formation_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return formation_catalog_from_csv_stream(f);
}

} // namespace fmsim
