#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <fmsim/formation.hpp>

using Catch::Approx;
using namespace fmsim;

TEST_CASE("Built-in catalog has sixteen complete shapes") {
  const auto& cat = formation_catalog();
  REQUIRE(cat.size() == 16);
  for (const auto& f : cat) {
    REQUIRE(f.slots[0].key == PositionKey::GK);
    REQUIRE(f.count_role(PositionRole::Goalkeeper) == 1);
    REQUIRE(f.count_role(PositionRole::Defender) >= 3);
    for (int i = 1; i < 11; ++i) {
      const auto& wp = f.slots[i].wp;
      REQUIRE(wp.defensive.length <= wp.base.length);
      REQUIRE(wp.offensive.length >= wp.base.length);
    }
  }
}

TEST_CASE("formation_by_key accepts dashed and compact keys") {
  auto a = formation_by_key("4-4-2");
  auto b = formation_by_key("442");
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a->key == "442");
  REQUIRE(formation_by_key("4-2-3-1").has_value());
  REQUIRE(formation_by_key("4-4-2 diamond").has_value());
  REQUIRE_FALSE(formation_by_key("2-2-6").has_value());
}

TEST_CASE("Formation::slot returns nullptr out of range") {
  auto f = formation_by_key("433");
  REQUIRE(f.has_value());
  REQUIRE(f->slot(0) != nullptr);
  REQUIRE(f->slot(10) != nullptr);
  REQUIRE(f->slot(11) == nullptr);
  REQUIRE(f->slot(-1) == nullptr);
  REQUIRE(f->role(10) == PositionRole::Forward);
}

TEST_CASE("Position keys parse case-insensitively") {
  REQUIRE(position_key_from_string("st") == PositionKey::ST);
  REQUIRE(position_key_from_string("RCB") == PositionKey::RCB);
  REQUIRE_FALSE(position_key_from_string("XX").has_value());
  REQUIRE(role_of(PositionKey::CDM) == PositionRole::Defender);
  REQUIRE(std::string(to_string(PositionKey::LAM)) == "LAM");
}

TEST_CASE("formation_catalog_from_csv_stream keeps only complete shapes") {
  std::ostringstream csv;
  csv << "formation,slot,position,base_width,base_length,depth_offset,width_offset\n"
      << "# custom back five\n";
  const char* keys[11] = {"GK", "LWB", "LCB", "CB", "RCB", "RWB", "LCM", "CM", "RCM", "LF", "RF"};
  for (int i = 0; i < 11; ++i) {
    csv << "5-3-2x," << i << "," << keys[i] << "," << (0.05 + i * 0.08) << ",0.4,0.1,0.1\n";
  }
  csv << "broken,0,GK,0.5,0.05,0.02,0.08\n";          // only one slot
  csv << "nogk,0,CB,0.5,0.05,0.02,0.08\n";
  csv << "bad,row\n";

  std::istringstream in(csv.str());
  auto cat = formation_catalog_from_csv_stream(in);
  REQUIRE(cat.size() == 1);
  auto f = formation_by_key_in(cat, "5-3-2X");
  REQUIRE(f.has_value());
  REQUIRE(f->slots[3].key == PositionKey::CB);
  REQUIRE(f->slots[3].wp.base.width == Approx(0.29));
}

TEST_CASE("load_formation_catalog_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_formation_catalog_csv("no_such_formations.csv").has_value());
}
