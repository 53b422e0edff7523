#include <gtest/gtest.h>

#include <algorithm>

#include "core/Diagnostics.h"
#include "ecs/Pool.h"
#include "ecs/Systems.h"
#include "ecs/World.h"
#include "physics/Collision.h"
#include "physics/PhysicsConfig.h"
#include "physics/SpatialIndex.h"

namespace {

EntityId addBody(World& w, Rect box, BodyKind kind = BodyKind::Dynamic, Vec2 velocity = {}) {
  const EntityId e = w.create();
  w.registry.emplace<Transform>(e, Transform{Vec2{box.x, box.y}});
  PhysicsBody body{};
  body.size = Vec2{box.w, box.h};
  body.kind = kind;
  body.velocity = velocity;
  w.registry.emplace<PhysicsBody>(e, body);
  return e;
}

// One broad phase rebuild plus a collision pass, as a tick runs them.
struct CollisionFixture : ::testing::Test {
  World w;
  SpatialIndex index;
  CollisionSystem collision;
  ObjectPools pools{w};
  PhysicsConfig cfg;
  Diagnostics diag;

  void step() {
    Systems::rebuildIndex(w, index, cfg.contactSkin, diag);
    collision.run(w, index, cfg, pools, diag);
  }

  Transform& transform(EntityId e) { return w.registry.get<Transform>(e); }
  PhysicsBody& body(EntityId e) { return w.registry.get<PhysicsBody>(e); }
};

}  // namespace

// ===========================================================================
// Narrow phase geometry
// ===========================================================================

TEST(ContactTest, SeparatesAlongMinimumPenetrationAxis) {
  Contact c{};
  ASSERT_TRUE(CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{8, 2, 10, 10}, 0.01F, c));
  EXPECT_EQ(c.normal, (Vec2{1.0F, 0.0F}));
  EXPECT_FLOAT_EQ(c.penetration, 2.0F);

  ASSERT_TRUE(CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{-8, 2, 10, 10}, 0.01F, c));
  EXPECT_EQ(c.normal, (Vec2{-1.0F, 0.0F}));
  EXPECT_FLOAT_EQ(c.penetration, 2.0F);

  ASSERT_TRUE(CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{1, -7, 10, 10}, 0.01F, c));
  EXPECT_EQ(c.normal, (Vec2{0.0F, -1.0F}));
  EXPECT_FLOAT_EQ(c.penetration, 3.0F);
}

TEST(ContactTest, TiesResolveAlongY) {
  Contact c{};
  ASSERT_TRUE(CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{5, 5, 10, 10}, 0.01F, c));
  EXPECT_EQ(c.normal, (Vec2{0.0F, 1.0F}));
  EXPECT_FLOAT_EQ(c.penetration, 5.0F);
}

TEST(ContactTest, TouchingWithinSkinIsRestingContact) {
  Contact c{};
  ASSERT_TRUE(
      CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{0, 10.005F, 10, 10}, 0.01F, c));
  EXPECT_EQ(c.normal, (Vec2{0.0F, 1.0F}));
  EXPECT_FLOAT_EQ(c.penetration, 0.0F);

  ASSERT_TRUE(CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{0, 10, 10, 10}, 0.01F, c));
  EXPECT_FLOAT_EQ(c.penetration, 0.0F);
}

TEST(ContactTest, SeparatedOrCornerOnlyIsNoContact) {
  Contact c{};
  EXPECT_FALSE(
      CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{0, 10.5F, 10, 10}, 0.01F, c));
  EXPECT_FALSE(
      CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{10.005F, 10.005F, 10, 10}, 0.01F, c));
  EXPECT_FALSE(CollisionSystem::computeContact(Rect{0, 0, 10, 10}, Rect{50, 50, 10, 10}, 0.01F, c));
}

// ===========================================================================
// Resolution
// ===========================================================================

TEST_F(CollisionFixture, EqualMassesEachMoveHalfThePenetration) {
  const EntityId a = addBody(w, Rect{0, 0, 32, 32}, BodyKind::Dynamic, Vec2{100.0F, 0.0F});
  const EntityId b = addBody(w, Rect{28, 0, 32, 32}, BodyKind::Dynamic, Vec2{-100.0F, 0.0F});

  step();

  ASSERT_EQ(collision.contacts().size(), 1u);
  EXPECT_FLOAT_EQ(collision.contacts()[0].penetration, 4.0F);
  EXPECT_FLOAT_EQ(collision.contacts()[0].relativeNormalVelocity, -200.0F);
  EXPECT_FLOAT_EQ(transform(a).pos.x, -2.0F);
  EXPECT_FLOAT_EQ(transform(b).pos.x, 30.0F);
  EXPECT_FLOAT_EQ(body(a).velocity.x, 0.0F);
  EXPECT_FLOAT_EQ(body(b).velocity.x, 0.0F);
  EXPECT_FALSE(body(a).grounded);
  EXPECT_FALSE(body(b).grounded);
}

TEST_F(CollisionFixture, CorrectionSplitsByInverseMass) {
  const EntityId light = addBody(w, Rect{0, 0, 32, 32});
  const EntityId heavy = addBody(w, Rect{28, 0, 32, 32});
  body(heavy).mass = 3.0F;

  step();

  EXPECT_FLOAT_EQ(transform(light).pos.x, -3.0F);
  EXPECT_FLOAT_EQ(transform(heavy).pos.x, 29.0F);
}

TEST_F(CollisionFixture, StaticBodyAbsorbsTheWholeCorrection) {
  const EntityId box = addBody(w, Rect{0, 72, 32, 32}, BodyKind::Dynamic, Vec2{0.0F, 300.0F});
  const EntityId floor = addBody(w, Rect{-100, 100, 200, 16}, BodyKind::Static);

  step();

  EXPECT_FLOAT_EQ(transform(box).pos.y + 32.0F, 100.0F);
  EXPECT_FLOAT_EQ(body(box).velocity.y, 0.0F);
  EXPECT_TRUE(body(box).grounded);
  EXPECT_EQ(transform(floor).pos, (Vec2{-100.0F, 100.0F}));
}

TEST_F(CollisionFixture, BodyAcrossTileSeamIsCorrectedOnce) {
  const EntityId box = addBody(w, Rect{16, 72, 32, 32}, BodyKind::Dynamic, Vec2{0.0F, 300.0F});
  addBody(w, Rect{0, 100, 32, 16}, BodyKind::Static);
  addBody(w, Rect{32, 100, 32, 16}, BodyKind::Static);

  step();

  ASSERT_EQ(collision.contacts().size(), 2u);
  EXPECT_FLOAT_EQ(collision.contacts()[0].penetration, 4.0F);
  EXPECT_FLOAT_EQ(collision.contacts()[1].penetration, 0.0F);
  EXPECT_FLOAT_EQ(transform(box).pos.y + 32.0F, 100.0F);
  EXPECT_FLOAT_EQ(body(box).velocity.y, 0.0F);
  EXPECT_TRUE(body(box).grounded);

  step();

  EXPECT_FLOAT_EQ(transform(box).pos.y + 32.0F, 100.0F);
  EXPECT_TRUE(body(box).grounded);
}

TEST_F(CollisionFixture, BodyAboveIsGroundedRegardlessOfPairOrder) {
  const EntityId floor = addBody(w, Rect{-100, 100, 200, 16}, BodyKind::Static);
  const EntityId box = addBody(w, Rect{0, 70, 32, 32});

  step();

  ASSERT_EQ(collision.contacts().size(), 1u);
  EXPECT_EQ(collision.contacts()[0].a, floor);
  EXPECT_EQ(collision.contacts()[0].normal, (Vec2{0.0F, -1.0F}));
  EXPECT_TRUE(body(box).grounded);
}

TEST_F(CollisionFixture, RestitutionBouncesApproachingBodies) {
  cfg.restitution = 1.0F;
  const EntityId box = addBody(w, Rect{0, 70, 32, 32}, BodyKind::Dynamic, Vec2{0.0F, 200.0F});
  addBody(w, Rect{-100, 100, 200, 16}, BodyKind::Static);

  step();

  EXPECT_FLOAT_EQ(body(box).velocity.y, -200.0F);
}

TEST_F(CollisionFixture, SeparatingBodiesKeepTheirVelocity) {
  const EntityId box = addBody(w, Rect{0, 70, 32, 32}, BodyKind::Dynamic, Vec2{0.0F, -50.0F});
  addBody(w, Rect{-100, 100, 200, 16}, BodyKind::Static);

  step();

  EXPECT_FLOAT_EQ(body(box).velocity.y, -50.0F);
}

TEST_F(CollisionFixture, EitherSideMayOptIntoTheOther) {
  const EntityId a = addBody(w, Rect{0, 0, 32, 32});
  const EntityId b = addBody(w, Rect{28, 0, 32, 32});
  body(a).layer = 1U;
  body(a).mask = 0U;
  body(b).layer = 2U;
  body(b).mask = 1U;

  step();
  EXPECT_EQ(collision.contacts().size(), 1u);

  body(b).mask = 0U;
  step();
  EXPECT_TRUE(collision.contacts().empty());
}

TEST_F(CollisionFixture, StaticPairsAreIgnored) {
  addBody(w, Rect{0, 0, 32, 32}, BodyKind::Static);
  addBody(w, Rect{10, 10, 32, 32}, BodyKind::Static);

  step();

  EXPECT_TRUE(collision.contacts().empty());
  EXPECT_TRUE(collision.overlaps().empty());
}

TEST_F(CollisionFixture, TriggerReportsOverlapWithoutResponse) {
  const EntityId trigger = addBody(w, Rect{0, 0, 50, 50}, BodyKind::Trigger);
  const EntityId box = addBody(w, Rect{10, 10, 10, 10}, BodyKind::Dynamic, Vec2{5.0F, 5.0F});

  step();

  EXPECT_TRUE(collision.contacts().empty());
  ASSERT_EQ(collision.overlaps().size(), 1u);
  EXPECT_EQ(collision.overlaps()[0], (OverlapEvent{trigger, box}));
  EXPECT_EQ(transform(box).pos, (Vec2{10.0F, 10.0F}));
  EXPECT_EQ(body(box).velocity, (Vec2{5.0F, 5.0F}));
}

TEST_F(CollisionFixture, TriggerTouchingEdgeDoesNotOverlap) {
  addBody(w, Rect{0, 0, 50, 50}, BodyKind::Trigger);
  addBody(w, Rect{50, 10, 10, 10});

  step();

  EXPECT_TRUE(collision.overlaps().empty());
}

TEST_F(CollisionFixture, ZeroAreaBodyIsReportedAndSkipped) {
  const EntityId flat = addBody(w, Rect{0, 0, 32, 0});
  addBody(w, Rect{0, -10, 32, 32}, BodyKind::Static);

  step();

  EXPECT_TRUE(collision.contacts().empty());
  EXPECT_FALSE(index.contains(flat));
  const auto& frame = diag.frame();
  EXPECT_NE(std::find(frame.begin(), frame.end(), Diagnostic{flat, DiagnosticKind::InvalidAabb}),
            frame.end());
}

TEST_F(CollisionFixture, DespawnOnContactReturnsPooledBodyToPool) {
  PoolTemplate tmpl{};
  tmpl.body.size = Vec2{8.0F, 4.0F};
  tmpl.body.despawnOnContact = true;
  const int pool = pools.add("bolts", 2, tmpl);
  const auto bolt = pools.spawn(pool, Vec2{95.0F, 10.0F}, Vec2{480.0F, 0.0F});
  ASSERT_TRUE(bolt.has_value());
  addBody(w, Rect{100, 0, 32, 64}, BodyKind::Static);

  step();

  ASSERT_EQ(collision.released().size(), 1u);
  EXPECT_EQ(collision.released()[0], *bolt);
  EXPECT_TRUE(w.valid(*bolt));
  EXPECT_TRUE(w.registry.all_of<Dormant>(*bolt));
  EXPECT_EQ(pools.get(pool)->activeCount(), 0u);
}

TEST_F(CollisionFixture, DespawnOnContactDestroysUnpooledBody) {
  const EntityId rock = addBody(w, Rect{95, 10, 8, 4});
  body(rock).despawnOnContact = true;
  addBody(w, Rect{100, 0, 32, 64}, BodyKind::Static);

  step();

  EXPECT_FALSE(w.valid(rock));
}

TEST_F(CollisionFixture, DormantBodiesAreIgnored) {
  PoolTemplate tmpl{};
  tmpl.body.size = Vec2{32.0F, 32.0F};
  pools.add("crates", 1, tmpl);
  addBody(w, Rect{0, 0, 32, 32});

  step();

  // The parked slot sits at the origin with a zero-size default body and never pairs.
  EXPECT_TRUE(collision.contacts().empty());
}
