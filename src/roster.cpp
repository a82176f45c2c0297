#include <fmsim/roster.hpp>
#include <algorithm>
#include <array>
#include <fstream>
#include <utility>
#include "csv_util.hpp"

namespace fmsim {

namespace {

using Field = double PlayerAttributes::*;

const std::vector<std::pair<std::string, Field>>& field_table() {
  static const std::vector<std::pair<std::string, Field>> table = {
    {"pace", &PlayerAttributes::pace},
    {"acceleration", &PlayerAttributes::acceleration},
    {"agility", &PlayerAttributes::agility},
    {"strength", &PlayerAttributes::strength},
    {"stamina", &PlayerAttributes::stamina},
    {"technique", &PlayerAttributes::technique},
    {"passing", &PlayerAttributes::passing},
    {"finishing", &PlayerAttributes::finishing},
    {"dribbling", &PlayerAttributes::dribbling},
    {"first_touch", &PlayerAttributes::first_touch},
    {"crossing", &PlayerAttributes::crossing},
    {"tackling", &PlayerAttributes::tackling},
    {"marking", &PlayerAttributes::marking},
    {"heading", &PlayerAttributes::heading},
    {"long_shots", &PlayerAttributes::long_shots},
    {"composure", &PlayerAttributes::composure},
    {"decisions", &PlayerAttributes::decisions},
    {"concentration", &PlayerAttributes::concentration},
    {"anticipation", &PlayerAttributes::anticipation},
    {"positioning", &PlayerAttributes::positioning},
    {"vision", &PlayerAttributes::vision},
    {"off_the_ball", &PlayerAttributes::off_the_ball},
    {"teamwork", &PlayerAttributes::teamwork},
    {"work_rate", &PlayerAttributes::work_rate},
    {"aggression", &PlayerAttributes::aggression},
    {"bravery", &PlayerAttributes::bravery},
    {"flair", &PlayerAttributes::flair},
    {"handling", &PlayerAttributes::handling},
    {"reflexes", &PlayerAttributes::reflexes},
  };
  return table;
}

std::optional<Field> find_field(std::string_view name) {
  const std::string key = detail::lower(std::string(name));
  for (const auto& [n, f] : field_table()) {
    if (n == key) return f;
  }
  return std::nullopt;
}

} // namespace

double* attribute_field(PlayerAttributes& a, std::string_view name) {
  auto f = find_field(name);
  return f ? &(a.**f) : nullptr;
}

const double* attribute_field(const PlayerAttributes& a, std::string_view name) {
  auto f = find_field(name);
  return f ? &(a.**f) : nullptr;
}

const std::vector<std::string>& attribute_names() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> v;
    for (const auto& [n, f] : field_table()) v.push_back(n);
    return v;
  }();
  return names;
}

GoalAttributes goal_attributes(const PlayerAttributes& a) {
  GoalAttributes g;
  g.aggression = a.aggression;     g.work_rate = a.work_rate;
  g.off_the_ball = a.off_the_ball; g.finishing = a.finishing;
  g.vision = a.vision;             g.flair = a.flair;
  g.teamwork = a.teamwork;         g.passing = a.passing;
  g.decisions = a.decisions;       g.positioning = a.positioning;
  g.bravery = a.bravery;           g.pace = a.pace;
  g.marking = a.marking;           g.strength = a.strength;
  g.concentration = a.concentration; g.anticipation = a.anticipation;
  g.composure = a.composure;
  return g;
}

double decision_quality_for(AiDifficulty d) {
  switch (d) {
    case AiDifficulty::Easy:   return 0.8;
    case AiDifficulty::Normal: return 1.0;
    case AiDifficulty::Hard:   return 1.2;
  }
  return 1.0;
}

std::optional<Foot> foot_from_string(std::string_view s) {
  const std::string v = detail::lower(std::string(s));
  if (v == "r" || v == "right") return Foot::Right;
  if (v == "l" || v == "left")  return Foot::Left;
  if (v == "b" || v == "both")  return Foot::Both;
  return std::nullopt;
}

TeamSpec team_from_csv_stream(std::istream& in, const std::string& name, const std::string& formation) {
  TeamSpec team;
  team.name = name;
  team.formation = formation;

  std::vector<std::string> header;
  std::string line;
  while (std::getline(in, line)) {
    const std::string raw = detail::trim(line);
    if (detail::is_skippable(raw)) continue;
    auto cols = detail::split_csv_line(raw);

    if (header.empty()) {
      if (cols.size() >= 4 && detail::lower(cols[0]) == "slot") {
        for (auto& c : cols) header.push_back(detail::lower(c));
      }
      continue; // rows before the header are ignored
    }
    if (cols.size() < 4 || cols[1].empty()) continue;

    PlayerSpec p;
    p.name = cols[1];
    const auto key = position_key_from_string(cols[2]);
    const auto foot = cols[3].empty() ? std::optional<Foot>(Foot::Right) : foot_from_string(cols[3]);
    if (!key || !foot) continue;
    p.position = *key;
    p.foot = *foot;

    bool ok = true;
    for (std::size_t i = 4; i < cols.size() && i < header.size(); ++i) {
      if (cols[i].empty()) continue;
      double* field = attribute_field(p.attr, header[i]);
      if (!field) continue; // unknown column
      bool parsed = false;
      const double v = detail::to_double_safe(cols[i], parsed);
      if (!parsed) { ok = false; break; }
      *field = v;   // range is checked at match setup
    }
    if (!ok) continue;

    const std::string slot = detail::lower(cols[0]);
    if (slot.empty() || slot == "sub") {
      team.subs.push_back(std::move(p));
      continue;
    }
    bool slot_ok = false;
    p.slot = detail::to_int_safe(slot, slot_ok);
    if (!slot_ok) continue;
    team.starters.push_back(std::move(p));
  }
  return team;
}

std::optional<TeamSpec> load_team_csv(const std::string& path, const std::string& name, const std::string& formation) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return team_from_csv_stream(f, name, formation);
}

// Role-shaped offsets around the base rating.
static void shape_for_role(PlayerAttributes& a, PositionRole role, double r, int slot) {
  for (const auto& [n, f] : field_table()) a.*f = r;
  const double wobble = double((slot * 7) % 5) - 2.0; // -2..2, varies by slot
  auto set = [&](double PlayerAttributes::* f, double delta) {
    a.*f = std::clamp(r + delta + wobble, 1.0, 99.0);
  };
  switch (role) {
    case PositionRole::Goalkeeper:
      set(&PlayerAttributes::handling, 15);   set(&PlayerAttributes::reflexes, 15);
      set(&PlayerAttributes::positioning, 10); set(&PlayerAttributes::finishing, -40);
      set(&PlayerAttributes::dribbling, -30); set(&PlayerAttributes::pace, -15);
      break;
    case PositionRole::Defender:
      set(&PlayerAttributes::tackling, 12);   set(&PlayerAttributes::marking, 12);
      set(&PlayerAttributes::strength, 8);    set(&PlayerAttributes::heading, 8);
      set(&PlayerAttributes::finishing, -20); set(&PlayerAttributes::handling, -40);
      set(&PlayerAttributes::reflexes, -40);
      break;
    case PositionRole::Midfielder:
      set(&PlayerAttributes::passing, 12);    set(&PlayerAttributes::vision, 10);
      set(&PlayerAttributes::stamina, 10);    set(&PlayerAttributes::work_rate, 8);
      set(&PlayerAttributes::handling, -40);  set(&PlayerAttributes::reflexes, -40);
      break;
    case PositionRole::Forward:
      set(&PlayerAttributes::finishing, 15);  set(&PlayerAttributes::off_the_ball, 12);
      set(&PlayerAttributes::pace, 8);        set(&PlayerAttributes::dribbling, 8);
      set(&PlayerAttributes::tackling, -20);  set(&PlayerAttributes::marking, -20);
      set(&PlayerAttributes::handling, -40);  set(&PlayerAttributes::reflexes, -40);
      break;
  }
}

TeamSpec demo_team(const std::string& name, const std::string& formation, double rating) {
  TeamSpec team;
  team.name = name;
  team.formation = formation;
  const double r = std::clamp(rating, 10.0, 90.0);
  const auto f = formation_by_key(formation);
  if (!f) return team; // rejected later as an unknown formation

  for (int s = 0; s < 11; ++s) {
    PlayerSpec p;
    p.slot = s;
    p.position = f->slots[s].key;
    p.name = name + " " + to_string(p.position);
    p.foot = (s % 4 == 1) ? Foot::Left : Foot::Right;
    shape_for_role(p.attr, role_of(p.position), r, s);
    team.starters.push_back(std::move(p));
  }
  for (int s = 0; s < 5; ++s) {
    PlayerSpec p;
    p.position = s == 0 ? PositionKey::GK : PositionKey::CM;
    p.name = name + " SUB" + std::to_string(s + 1);
    shape_for_role(p.attr, role_of(p.position), r - 5.0, s);
    team.subs.push_back(std::move(p));
  }
  return team;
}

} // namespace fmsim
