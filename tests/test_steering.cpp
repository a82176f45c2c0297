#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <fmsim/steering.hpp>

using Catch::Approx;
using namespace fmsim;

TEST_CASE("seek heads straight at the target at full speed") {
  Vec2 v = seek(Vec2{0, 0}, Vec2{10, 0}, 6.0);
  REQUIRE(v.x == Approx(6.0));
  REQUIRE(v.y == Approx(0.0));
  REQUIRE(seek(Vec2{0, 0}, Vec2{10, 0}, 0.0) == Vec2{});
}

TEST_CASE("arrive slows down inside the slowing distance") {
  Vec2 far = arrive(Vec2{0, 0}, Vec2{20, 0}, 8.0, 4.0);
  Vec2 near = arrive(Vec2{0, 0}, Vec2{2, 0}, 8.0, 4.0);
  REQUIRE(far.length() == Approx(8.0));
  REQUIRE(near.length() == Approx(4.0));
  REQUIRE(arrive(Vec2{3, 3}, Vec2{3, 3}, 8.0, 4.0) == Vec2{});
}

TEST_CASE("pursuit leads a moving target, evade runs away from it") {
  Vec2 chase = pursuit(Vec2{0, 0}, Vec2{10, 0}, Vec2{0, 5}, 5.0, 1.0);
  REQUIRE(chase.y > 0.0);
  REQUIRE(chase.length() == Approx(5.0));

  Vec2 flee = evade(Vec2{0, 0}, Vec2{3, 0}, Vec2{}, 4.0, 1.0);
  REQUIRE(flee.x == Approx(-4.0));
}

TEST_CASE("separation pushes away from close neighbours only") {
  std::vector<Vec2> n = {Vec2{1, 0}, Vec2{50, 50}};
  Vec2 push = separation(Vec2{0, 0}, n, 2.0, 1.0);
  REQUIRE(push.x < 0.0);
  REQUIRE(push.y == Approx(0.0));
  REQUIRE(separation(Vec2{0, 0}, {Vec2{10, 0}}, 2.0, 1.0) == Vec2{});
}

TEST_CASE("steer_toward caps the velocity change") {
  Vec2 v = steer_toward(Vec2{0, 0}, Vec2{10, 0}, 0.5);
  REQUIRE(v.x == Approx(0.5));
  Vec2 done = steer_toward(Vec2{1, 0}, Vec2{1.2, 0}, 0.5);
  REQUIRE(done.x == Approx(1.2));
}
