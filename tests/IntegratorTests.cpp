#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "core/Diagnostics.h"
#include "core/Time.h"
#include "ecs/Systems.h"
#include "ecs/World.h"
#include "physics/PhysicsConfig.h"

namespace {

constexpr float kDt = 1.0F / 120.0F;

struct IntegratorFixture : ::testing::Test {
  World w;
  PhysicsConfig cfg;
  Diagnostics diag;

  EntityId addBody(BodyKind kind = BodyKind::Dynamic) {
    const EntityId e = w.create();
    w.registry.emplace<Transform>(e);
    PhysicsBody body{};
    body.size = Vec2{16.0F, 16.0F};
    body.kind = kind;
    w.registry.emplace<PhysicsBody>(e, body);
    return e;
  }

  void step() { Systems::integrate(w, cfg, TimeStep{kDt}, diag); }

  Transform& transform(EntityId e) { return w.registry.get<Transform>(e); }
  PhysicsBody& body(EntityId e) { return w.registry.get<PhysicsBody>(e); }

  bool reported(EntityId e, DiagnosticKind kind) const {
    const auto& f = diag.frame();
    return std::find(f.begin(), f.end(), Diagnostic{e, kind}) != f.end();
  }
};

}  // namespace

TEST_F(IntegratorFixture, VelocityUpdatesBeforePosition) {
  const EntityId e = addBody();

  step();

  EXPECT_FLOAT_EQ(body(e).velocity.y, cfg.gravity * kDt);
  EXPECT_FLOAT_EQ(transform(e).pos.y, cfg.gravity * kDt * kDt);
}

TEST_F(IntegratorFixture, GravityScaleAppliesPerBody) {
  const EntityId floaty = addBody();
  body(floaty).gravityScale = 0.0F;
  const EntityId heavy = addBody();
  body(heavy).gravityScale = 2.0F;

  step();

  EXPECT_FLOAT_EQ(body(floaty).velocity.y, 0.0F);
  EXPECT_FLOAT_EQ(body(heavy).velocity.y, 2.0F * cfg.gravity * kDt);
}

TEST_F(IntegratorFixture, GroundedBodySkipsGravity) {
  const EntityId e = addBody();
  body(e).grounded = true;

  for (int i = 0; i < 10; ++i) {
    step();
  }

  EXPECT_FLOAT_EQ(body(e).velocity.y, 0.0F);
  EXPECT_FLOAT_EQ(transform(e).pos.y, 0.0F);
}

TEST_F(IntegratorFixture, ForceIsDividedByMassAndCleared) {
  cfg.gravity = 0.0F;
  const EntityId e = addBody();
  body(e).mass = 4.0F;
  body(e).force = Vec2{480.0F, 0.0F};

  step();

  EXPECT_FLOAT_EQ(body(e).velocity.x, 120.0F * kDt);
  EXPECT_EQ(body(e).force, Vec2{});

  step();
  EXPECT_FLOAT_EQ(body(e).velocity.x, 120.0F * kDt);
}

TEST_F(IntegratorFixture, SpeedIsClampedPerAxis) {
  cfg.maxSpeed = 100.0F;
  const EntityId e = addBody();
  body(e).velocity = Vec2{-500.0F, 900.0F};

  step();

  EXPECT_FLOAT_EQ(body(e).velocity.x, -100.0F);
  EXPECT_FLOAT_EQ(body(e).velocity.y, 100.0F);
}

TEST_F(IntegratorFixture, StaticTriggerAndDormantBodiesDoNotMove) {
  const EntityId wall = addBody(BodyKind::Static);
  const EntityId zone = addBody(BodyKind::Trigger);
  const EntityId parked = addBody();
  w.registry.emplace<Dormant>(parked);
  body(wall).velocity = Vec2{10.0F, 10.0F};

  step();

  EXPECT_EQ(transform(wall).pos, Vec2{});
  EXPECT_EQ(transform(zone).pos, Vec2{});
  EXPECT_EQ(transform(parked).pos, Vec2{});
  EXPECT_EQ(body(parked).velocity, Vec2{});
}

TEST_F(IntegratorFixture, NonFiniteVelocityIsResetAndReported) {
  const EntityId e = addBody();
  body(e).velocity = Vec2{std::numeric_limits<float>::quiet_NaN(), 0.0F};
  transform(e).pos = Vec2{5.0F, 6.0F};

  step();

  EXPECT_EQ(body(e).velocity, Vec2{});
  EXPECT_EQ(transform(e).pos, (Vec2{5.0F, 6.0F}));
  EXPECT_TRUE(reported(e, DiagnosticKind::NonFiniteState));
  EXPECT_TRUE(w.valid(e));
}

TEST_F(IntegratorFixture, InfiniteForceIsContained) {
  const EntityId e = addBody();
  body(e).force = Vec2{std::numeric_limits<float>::infinity(), 0.0F};

  step();

  // +inf clamps to maxSpeed.
  EXPECT_TRUE(std::isfinite(body(e).velocity.x));
  EXPECT_TRUE(std::isfinite(transform(e).pos.x));
}

TEST_F(IntegratorFixture, NonFinitePositionIsRestored) {
  const EntityId e = addBody();
  transform(e).pos = Vec2{std::numeric_limits<float>::infinity(), 0.0F};

  step();

  EXPECT_EQ(transform(e).pos, Vec2{});
  EXPECT_EQ(body(e).velocity, Vec2{});
  EXPECT_TRUE(reported(e, DiagnosticKind::NonFiniteState));
}

TEST_F(IntegratorFixture, OtherBodiesKeepMovingAfterAReset) {
  const EntityId bad = addBody();
  const EntityId good = addBody();
  body(bad).velocity = Vec2{std::numeric_limits<float>::quiet_NaN(), 0.0F};

  step();

  EXPECT_GT(body(good).velocity.y, 0.0F);
  EXPECT_GT(transform(good).pos.y, 0.0F);
}
