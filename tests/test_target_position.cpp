#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fmsim/target_position.hpp>

using Catch::Approx;
using namespace fmsim;

static TargetContext midfielder_context() {
  TargetContext ctx;
  ctx.slot = 6;
  ctx.position = PositionKey::LCM;
  ctx.wp = Waypoints::from_base(NormPos{0.35, 0.45}, 0.10, 0.12);
  for (int i = 0; i < 11; ++i) {
    ctx.teammates[i] = NormPos{0.05 + i * 0.09, 0.1 + i * 0.07};
    ctx.active[i] = true;
    ctx.roles[i] = i == 0 ? PositionRole::Goalkeeper : (i < 5 ? PositionRole::Defender : PositionRole::Midfielder);
  }
  ctx.teammates[6] = ctx.wp.base;
  ctx.ball = NormPos{0.8, 0.8};
  return ctx;
}

TEST_CASE("Microfocus follows a rectified sine") {
  REQUIRE(microfocus_strength(0.0, 0.15, 0.25) == Approx(0.15));
  REQUIRE(microfocus_strength(0.25, 0.15, 0.25) == Approx(0.0));
  REQUIRE(microfocus_strength(0.125, 0.15, 0.25) == Approx(0.075));
  REQUIRE(microfocus_role_multiplier(PositionRole::Goalkeeper, true) == Approx(0.0));
  REQUIRE(microfocus_role_multiplier(PositionRole::Forward, true) >
          microfocus_role_multiplier(PositionRole::Forward, false));
}

TEST_CASE("Tactical goal targets") {
  Waypoints wp = Waypoints::from_base(NormPos{0.2, 0.5}, 0.1, 0.1);
  NormPos ball{0.6, 0.6};
  NormPos chase = tactical_goal_target(TacticalGoal::attack(OffensiveGoal::MoveToBall), wp, ball);
  REQUIRE(chase.width == Approx(0.6));
  REQUIRE(chase.length == Approx(0.6));

  NormPos attack = tactical_goal_target(TacticalGoal::attack(OffensiveGoal::AttackGoal), wp, ball);
  REQUIRE(attack.length == Approx(0.85));

  NormPos back = tactical_goal_target(TacticalGoal::defend(DefensiveGoal::TrackBack), wp, ball);
  REQUIRE(back.length == Approx(wp.defensive.length));
}

TEST_CASE("Late game pushes a losing side forward") {
  NormPos p{0.5, 0.5};
  REQUIRE(apply_late_game(p, 60, -1).length == Approx(0.5));
  REQUIRE(apply_late_game(p, 90, -1).length == Approx(0.58));
  REQUIRE(apply_late_game(p, 95, 1).length == Approx(0.44));
}

TEST_CASE("Instructions shift width and depth") {
  Waypoints wp = Waypoints::from_base(NormPos{0.2, 0.5}, 0.1, 0.1);
  PlayerInstructions wide{WidthInstruction::StayWide, DepthInstruction::GetForward};
  NormPos p = apply_instructions(NormPos{0.2, 0.5}, wide, wp, NormPos{0.5, 0.5}, true);
  REQUIRE(p.width == Approx(0.15));
  REQUIRE(p.length == Approx(0.58));

  // depth only applies in possession
  NormPos q = apply_instructions(NormPos{0.2, 0.5}, wide, wp, NormPos{0.5, 0.5}, false);
  REQUIRE(q.length == Approx(0.5));
}

TEST_CASE("compute_target blends every layer and stays inside the clamp") {
  TargetContext ctx = midfielder_context();
  ctx.goal = TacticalGoal::defend(DefensiveGoal::HoldPosition);
  TargetBreakdown bd;
  NormPos p = compute_target(ctx, {}, &bd);
  REQUIRE(p.width >= 0.05);
  REQUIRE(p.width <= 0.95);
  REQUIRE(p.length >= 0.05);
  REQUIRE(p.length <= 0.95);
  REQUIRE(bd.final_pos.width == Approx(p.width));
  REQUIRE(bd.tactical.length == Approx(ctx.wp.defensive.length));
}

TEST_CASE("Defending players far from shape are pulled back toward it") {
  TargetContext ctx = midfielder_context();
  ctx.goal = TacticalGoal::defend(DefensiveGoal::PressOpponent);
  ctx.team_has_possession = false;
  ctx.teammates[6] = NormPos{0.9, 0.9};   // drifted far up the pitch

  TargetBreakdown bd;
  compute_target(ctx, {}, &bd);
  REQUIRE(norm_distance(bd.retention, ctx.wp.defensive) < norm_distance(bd.microfocus, ctx.wp.defensive));

  ctx.team_has_possession = true;
  compute_target(ctx, {}, &bd);
  REQUIRE(bd.retention.width == Approx(bd.microfocus.width));
}

TEST_CASE("Keeper target moves toward the sweeping spot") {
  TargetContext ctx = midfielder_context();
  ctx.slot = 0;
  ctx.position = PositionKey::GK;
  ctx.wp = Waypoints::from_base(NormPos{0.5, 0.04}, 0.02, 0.08);
  ctx.teammates[0] = ctx.wp.base;
  ctx.goal = TacticalGoal::defend(DefensiveGoal::HoldPosition);
  ctx.gk_state = GkState::ComingOut;
  ctx.gk_target = NormPos{0.5, 0.3};

  NormPos with = compute_target(ctx);
  ctx.gk_target.reset();
  NormPos without = compute_target(ctx);
  REQUIRE(with.length > without.length);
}

TEST_CASE("Teammate separation") {
  TargetContext ctx = midfielder_context();
  ctx.goal = TacticalGoal::defend(DefensiveGoal::HoldPosition);
  TargetBreakdown bd;

  SECTION("no teammate nearby leaves the target alone") {
    compute_target(ctx, {}, &bd);
    REQUIRE(bd.separation.width == Approx(bd.retention.width));
    REQUIRE(bd.separation.length == Approx(bd.retention.length));
  }

  SECTION("a close teammate pushes the target away") {
    ctx.teammates[7] = NormPos{ctx.teammates[6].width + 0.02, ctx.teammates[6].length};
    compute_target(ctx, {}, &bd);
    REQUIRE(bd.separation.width == Approx(bd.retention.width - 0.5 * 0.15));
    REQUIRE(bd.separation.length == Approx(bd.retention.length));
  }

  SECTION("stacked teammates split to opposite sides") {
    ctx.teammates[7] = ctx.teammates[6];
    compute_target(ctx, {}, &bd);
    REQUIRE(bd.separation.width == Approx(bd.retention.width - 0.15));
    REQUIRE(bd.separation.length == Approx(bd.retention.length));

    TargetBreakdown other;
    ctx.slot = 7;
    compute_target(ctx, {}, &other);
    REQUIRE(other.separation.width == Approx(other.retention.width + 0.15));
  }
}

TEST_CASE("Defensive line layer") {
  TargetContext ctx = midfielder_context();
  ctx.slot = 2;
  ctx.position = PositionKey::LCB;
  ctx.wp = Waypoints::from_base(NormPos{0.35, 0.25}, 0.08, 0.10);
  ctx.goal = TacticalGoal::defend(DefensiveGoal::HoldPosition);
  const double line_avg = (0.17 + 0.24 + 0.31 + 0.38) / 4.0;   // defenders in slots 1..4
  TargetBreakdown bd;

  SECTION("defenders step toward the average line") {
    compute_target(ctx, {}, &bd);
    REQUIRE(bd.line.length == Approx(bd.separation.length + (line_avg - bd.separation.length) * 0.6));
    REQUIRE(bd.line.width == Approx(bd.separation.width));
  }

  SECTION("an active trap pulls harder to the trap line and narrows") {
    DefensiveLine line;
    line.trap_active = true;
    line.line_m = 42.0;
    line.coordination = 0.8;
    ctx.line = &line;
    compute_target(ctx, {}, &bd);
    const double trap = 42.0 / kFieldLengthM;
    REQUIRE(bd.line.length == Approx(bd.separation.length + (trap - bd.separation.length) * (0.6 + 0.8 * 0.3)));
    REQUIRE(bd.line.width == Approx(bd.separation.width + (0.5 - bd.separation.width) * 0.1 * 0.5));
  }

  SECTION("an inactive line falls back to the average") {
    DefensiveLine line;
    line.line_m = 42.0;
    line.coordination = 0.8;
    ctx.line = &line;
    compute_target(ctx, {}, &bd);
    REQUIRE(bd.line.length == Approx(bd.separation.length + (line_avg - bd.separation.length) * 0.6));
  }

  SECTION("midfielders ignore the line") {
    ctx = midfielder_context();
    ctx.goal = TacticalGoal::defend(DefensiveGoal::HoldPosition);
    compute_target(ctx, {}, &bd);
    REQUIRE(bd.line.length == Approx(bd.separation.length));
  }
}
