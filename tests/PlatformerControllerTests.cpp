#include <gtest/gtest.h>

#include <algorithm>

#include "character/PlatformerController.h"
#include "core/Diagnostics.h"
#include "core/Time.h"
#include "ecs/Pool.h"
#include "ecs/World.h"

namespace {

constexpr float kDt = 1.0F / 120.0F;

struct PlatformerFixture : ::testing::Test {
  World w;
  PlatformerController controller;
  ObjectPools pools{w};
  Diagnostics diag;
  PlatformerConfig cfg;
  EntityId hero = kInvalidEntity;

  void SetUp() override { cfg.move.maxSpeed = 200.0F; }

  void spawnHero(int shootPool = -1, PlatformerController::Sounds sounds = {}) {
    const int idx = controller.addConfig(cfg, shootPool, sounds);
    hero = w.create();
    w.registry.emplace<Transform>(hero);
    PhysicsBody body{};
    body.size = Vec2{24.0F, 32.0F};
    w.registry.emplace<PhysicsBody>(hero, body);
    controller.attach(w, hero, idx);
  }

  // One controller update with the collision pass's verdict already applied.
  void tick(bool grounded, InputState in = {}) {
    body().grounded = grounded;
    w.registry.replace<InputState>(hero, in);
    controller.update(w, hero, TimeStep{kDt}, diag);
  }

  void idle(bool grounded, int ticks) {
    for (int i = 0; i < ticks; ++i) {
      tick(grounded);
    }
  }

  static InputState press() {
    InputState in{};
    in.jumpHeld = true;
    in.jumpPressed = true;
    return in;
  }

  static InputState shoot() {
    InputState in{};
    in.actionHeld = true;
    in.actionPressed = true;
    return in;
  }

  PhysicsBody& body() { return w.registry.get<PhysicsBody>(hero); }
  PlatformerState& state() { return w.registry.get<PlatformerState>(hero); }
  bool jumped() { return body().velocity.y == -cfg.jump.impulse; }

  bool reported(DiagnosticKind kind) const {
    const auto& f = diag.frame();
    return std::find(f.begin(), f.end(), Diagnostic{hero, kind}) != f.end();
  }
};

}  // namespace

TEST_F(PlatformerFixture, AttachAddsControllerState) {
  spawnHero();
  EXPECT_TRUE((w.registry.all_of<PlatformerState, InputState>(hero)));
  EXPECT_EQ(w.registry.get<Behavior>(hero).kind, BehaviorKind::Platformer);
  EXPECT_EQ(state().configIndex, 0);
  EXPECT_EQ(controller.configCount(), 1u);
}

TEST_F(PlatformerFixture, JumpFromGround) {
  spawnHero();
  tick(true);
  tick(true, press());

  EXPECT_TRUE(jumped());
  EXPECT_FALSE(body().grounded);
  EXPECT_EQ(state().mode, PlatformerMode::Airborne);
  EXPECT_FLOAT_EQ(state().coyoteTimer, 0.0F);
  EXPECT_FLOAT_EQ(state().jumpBufferTimer, 0.0F);
}

TEST_F(PlatformerFixture, BufferedPressJumpsOnLanding) {
  spawnHero();
  tick(false, press());
  EXPECT_FALSE(jumped());

  idle(false, 5);  // well inside jumpBufferTime
  EXPECT_FALSE(jumped());

  tick(true);
  EXPECT_TRUE(jumped());
}

TEST_F(PlatformerFixture, StaleBufferedPressIsDropped) {
  spawnHero();
  tick(false, press());
  idle(false, 30);  // 0.25 s > jumpBufferTime

  tick(true);
  EXPECT_FALSE(jumped());
  EXPECT_EQ(state().mode, PlatformerMode::Grounded);
}

TEST_F(PlatformerFixture, CoyoteTimeAllowsLateJump) {
  spawnHero();
  tick(true);
  idle(false, 5);  // walked off a ledge 42 ms ago

  tick(false, press());
  EXPECT_TRUE(jumped());
}

TEST_F(PlatformerFixture, JumpAfterCoyoteTimeIsIgnored) {
  spawnHero();
  tick(true);
  idle(false, 20);  // 167 ms > coyoteTime

  tick(false, press());
  EXPECT_FALSE(jumped());
}

TEST_F(PlatformerFixture, OnePressJumpsOnce) {
  spawnHero();
  tick(true, press());
  ASSERT_TRUE(jumped());

  // Still reported grounded on the next tick (e.g. a low ceiling); the press was consumed.
  body().velocity.y = 0.0F;
  tick(true);
  EXPECT_FALSE(jumped());
}

TEST_F(PlatformerFixture, HorizontalInputSetsVelocityAndFacing) {
  spawnHero();
  InputState in{};
  in.axisX = -0.5F;
  tick(true, in);

  EXPECT_FLOAT_EQ(body().velocity.x, -100.0F);
  EXPECT_EQ(state().facingX, -1);

  in.axisX = 3.0F;
  tick(true, in);
  EXPECT_FLOAT_EQ(body().velocity.x, 200.0F);
  EXPECT_EQ(state().facingX, 1);
}

TEST_F(PlatformerFixture, FrictionBringsIdleBodyToRest) {
  spawnHero();
  body().velocity.x = 100.0F;

  tick(true);
  EXPECT_FLOAT_EQ(body().velocity.x, 75.0F);

  idle(true, 60);
  EXPECT_FLOAT_EQ(body().velocity.x, 0.0F);
}

TEST_F(PlatformerFixture, LandingAndJumpEmitAudioCues) {
  PlatformerController::Sounds sounds{};
  sounds.jump = AssetHandle{1};
  sounds.land = AssetHandle{2};
  spawnHero(-1, sounds);

  tick(false);
  EXPECT_FALSE(w.registry.all_of<AudioTrigger>(hero));

  tick(true);
  ASSERT_TRUE(w.registry.all_of<AudioTrigger>(hero));
  EXPECT_EQ(w.registry.get<AudioTrigger>(hero).cue, AudioCue::Land);
  EXPECT_EQ(w.registry.get<AudioTrigger>(hero).sound, AssetHandle{2});
  w.registry.remove<AudioTrigger>(hero);

  tick(true);
  EXPECT_FALSE(w.registry.all_of<AudioTrigger>(hero));

  tick(true, press());
  ASSERT_TRUE(w.registry.all_of<AudioTrigger>(hero));
  EXPECT_EQ(w.registry.get<AudioTrigger>(hero).cue, AudioCue::Jump);
}

TEST_F(PlatformerFixture, MissingBodyIsReportedNotFatal) {
  spawnHero();
  w.registry.remove<PhysicsBody>(hero);

  controller.update(w, hero, TimeStep{kDt}, diag);

  EXPECT_TRUE(reported(DiagnosticKind::MissingBody));
}

TEST_F(PlatformerFixture, ShootSpawnsFromPoolInFacingDirection) {
  PoolTemplate tmpl{};
  tmpl.body.size = Vec2{8.0F, 4.0F};
  const int pool = pools.add("bolts", 4, tmpl);
  cfg.shoot.enabled = true;
  cfg.shoot.pool = "bolts";
  cfg.shoot.speed = 500.0F;
  PlatformerController::Sounds sounds{};
  sounds.shoot = AssetHandle{9};
  spawnHero(pool, sounds);

  InputState in = shoot();
  in.axisX = -1.0F;
  tick(true, in);
  EXPECT_EQ(controller.queuedShots(), 1u);

  controller.flushShots(w, pools, diag);
  EXPECT_EQ(controller.queuedShots(), 0u);
  ASSERT_EQ(pools.get(pool)->activeCount(), 1u);

  auto active = w.registry.view<PoolSlot, PhysicsBody>(entt::exclude<Dormant>);
  for (auto e : active) {
    EXPECT_FLOAT_EQ(active.get<PhysicsBody>(e).velocity.x, -500.0F);
  }
  ASSERT_TRUE(w.registry.all_of<AudioTrigger>(hero));
  EXPECT_EQ(w.registry.get<AudioTrigger>(hero).cue, AudioCue::Shoot);
}

TEST_F(PlatformerFixture, ShootCooldownLimitsRate) {
  const int pool = pools.add("bolts", 8, PoolTemplate{});
  cfg.shoot.enabled = true;
  cfg.shoot.pool = "bolts";
  cfg.shoot.cooldown = 0.25F;
  spawnHero(pool);

  tick(true, shoot());
  tick(true, shoot());
  EXPECT_EQ(controller.queuedShots(), 1u);

  idle(true, 30);
  tick(true, shoot());
  EXPECT_EQ(controller.queuedShots(), 2u);
}

TEST_F(PlatformerFixture, ExhaustedPoolDropsShotWithoutCue) {
  const int pool = pools.add("bolts", 1, PoolTemplate{});
  cfg.shoot.enabled = true;
  cfg.shoot.pool = "bolts";
  cfg.shoot.cooldown = 0.0F;
  spawnHero(pool);

  tick(true, shoot());
  controller.flushShots(w, pools, diag);
  w.registry.remove<AudioTrigger>(hero);

  tick(true, shoot());
  controller.flushShots(w, pools, diag);

  EXPECT_TRUE(reported(DiagnosticKind::PoolExhausted));
  EXPECT_FALSE(w.registry.all_of<AudioTrigger>(hero));
  EXPECT_EQ(pools.get(pool)->activeCount(), 1u);
}

TEST_F(PlatformerFixture, ShootingFromMissingPoolIsReported) {
  cfg.shoot.enabled = true;
  cfg.shoot.pool = "nowhere";
  spawnHero(-1);

  tick(true, shoot());

  EXPECT_EQ(controller.queuedShots(), 0u);
  EXPECT_TRUE(reported(DiagnosticKind::UnknownPool));
}
