#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "ecs/World.h"
#include "physics/SpatialIndex.h"
#include "util/Math.h"

namespace {

// Deterministic LCG so failures reproduce.
class Lcg {
 public:
  explicit Lcg(std::uint32_t seed) : state_(seed) {}
  float next(float lo, float hi) {
    state_ = state_ * 1664525U + 1013904223U;
    const float u = static_cast<float>(state_ >> 8U) / static_cast<float>(1U << 24U);
    return lo + (hi - lo) * u;
  }

 private:
  std::uint32_t state_;
};

bool contains(const std::vector<EntityId>& v, EntityId id) {
  return std::find(v.begin(), v.end(), id) != v.end();
}

}  // namespace

TEST(SpatialIndexTest, InsertListsBodyInEveryTouchedCell) {
  World w;
  SpatialIndex index(64.0F);
  const EntityId small = w.create();
  const EntityId wide = w.create();

  EXPECT_TRUE(index.insert(small, Rect{10.0F, 10.0F, 20.0F, 20.0F}));
  EXPECT_TRUE(index.insert(wide, Rect{-10.0F, 10.0F, 140.0F, 20.0F}));

  EXPECT_EQ(index.cellCount(small), 1u);
  EXPECT_EQ(index.cellCount(wide), 4u);  // x cells -1..2
  EXPECT_EQ(index.bodyCount(), 2u);
}

TEST(SpatialIndexTest, RejectsDegenerateBoundsAndDuplicates) {
  World w;
  SpatialIndex index;
  const EntityId e = w.create();
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();

  EXPECT_FALSE(index.insert(e, Rect{0.0F, 0.0F, 0.0F, 10.0F}));
  EXPECT_FALSE(index.insert(e, Rect{0.0F, 0.0F, 10.0F, -1.0F}));
  EXPECT_FALSE(index.insert(e, Rect{nan, 0.0F, 10.0F, 10.0F}));
  EXPECT_FALSE(index.insert(e, Rect{0.0F, 0.0F, inf, 10.0F}));
  EXPECT_FALSE(index.insert(e, Rect{0.0F, 0.0F, 1.0e9F, 1.0e9F}));
  EXPECT_FALSE(index.contains(e));

  EXPECT_TRUE(index.insert(e, Rect{0.0F, 0.0F, 10.0F, 10.0F}));
  EXPECT_FALSE(index.insert(e, Rect{50.0F, 50.0F, 10.0F, 10.0F}));
  EXPECT_EQ(index.bodyCount(), 1u);
}

TEST(SpatialIndexTest, QueryReturnsSupersetOfTrueOverlaps) {
  World w;
  SpatialIndex index(48.0F);
  Lcg rng(1234U);

  std::vector<std::pair<EntityId, Rect>> bodies;
  for (int i = 0; i < 300; ++i) {
    const EntityId e = w.create();
    const Rect r{rng.next(-500.0F, 500.0F), rng.next(-500.0F, 500.0F), rng.next(1.0F, 120.0F),
                 rng.next(1.0F, 120.0F)};
    ASSERT_TRUE(index.insert(e, r));
    bodies.emplace_back(e, r);
  }

  std::vector<EntityId> found;
  for (int q = 0; q < 100; ++q) {
    const Rect area{rng.next(-600.0F, 600.0F), rng.next(-600.0F, 600.0F), rng.next(1.0F, 250.0F),
                    rng.next(1.0F, 250.0F)};
    found.clear();
    index.query(area, found);

    std::vector<EntityId> sorted = found;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end()) << "duplicate result";

    for (const auto& [id, r] : bodies) {
      if (util::overlaps(r, area)) {
        EXPECT_TRUE(contains(found, id)) << "query " << q << " missed an overlapping body";
      }
    }
  }
}

TEST(SpatialIndexTest, CandidatePairsReportEachPairOnce) {
  World w;
  SpatialIndex index(32.0F);
  const EntityId a = w.create();
  const EntityId b = w.create();
  const EntityId far = w.create();

  // a and b share a 3x3 block of cells.
  ASSERT_TRUE(index.insert(a, Rect{0.0F, 0.0F, 90.0F, 90.0F}));
  ASSERT_TRUE(index.insert(b, Rect{5.0F, 5.0F, 90.0F, 90.0F}));
  ASSERT_TRUE(index.insert(far, Rect{1000.0F, 1000.0F, 10.0F, 10.0F}));

  std::vector<CandidatePair> pairs;
  index.candidatePairs(pairs);
  ASSERT_EQ(pairs.size(), 1u);
  EXPECT_EQ(pairs[0].a, a);
  EXPECT_EQ(pairs[0].b, b);
}

TEST(SpatialIndexTest, CandidatePairsAreSortedByEntity) {
  World w;
  SpatialIndex index(64.0F);
  std::vector<EntityId> ids;
  for (int i = 0; i < 5; ++i) {
    ids.push_back(w.create());
  }
  // Inserted in reverse so cell order differs from id order.
  for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
    ASSERT_TRUE(index.insert(*it, Rect{0.0F, 0.0F, 16.0F, 16.0F}));
  }

  std::vector<CandidatePair> pairs;
  index.candidatePairs(pairs);
  ASSERT_EQ(pairs.size(), 10u);
  for (std::size_t i = 1; i < pairs.size(); ++i) {
    const auto prev = std::make_pair(entt::to_integral(pairs[i - 1].a), entt::to_integral(pairs[i - 1].b));
    const auto cur = std::make_pair(entt::to_integral(pairs[i].a), entt::to_integral(pairs[i].b));
    EXPECT_LT(prev, cur);
  }
}

TEST(SpatialIndexTest, NoSelfCollisionSkipsOnlySameLayerOptOuts) {
  World w;
  SpatialIndex index;
  const EntityId shotA = w.create();
  const EntityId shotB = w.create();
  const EntityId wall = w.create();
  const Rect box{0.0F, 0.0F, 10.0F, 10.0F};

  ASSERT_TRUE(index.insert(shotA, box, kLayerProjectile, true));
  ASSERT_TRUE(index.insert(shotB, box, kLayerProjectile, true));
  ASSERT_TRUE(index.insert(wall, box, kLayerProjectile, false));

  std::vector<CandidatePair> pairs;
  index.candidatePairs(pairs);
  ASSERT_EQ(pairs.size(), 2u);
  for (const CandidatePair& p : pairs) {
    EXPECT_TRUE(p.a == wall || p.b == wall);
  }
}

TEST(SpatialIndexTest, RemoveDropsBodyFromQueries) {
  World w;
  SpatialIndex index;
  const EntityId a = w.create();
  const EntityId b = w.create();
  ASSERT_TRUE(index.insert(a, Rect{0.0F, 0.0F, 100.0F, 100.0F}));
  ASSERT_TRUE(index.insert(b, Rect{10.0F, 10.0F, 10.0F, 10.0F}));

  EXPECT_TRUE(index.remove(a));
  EXPECT_FALSE(index.remove(a));
  EXPECT_FALSE(index.contains(a));

  std::vector<EntityId> found;
  index.query(Rect{0.0F, 0.0F, 200.0F, 200.0F}, found);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0], b);

  std::vector<CandidatePair> pairs;
  index.candidatePairs(pairs);
  EXPECT_TRUE(pairs.empty());
}

TEST(SpatialIndexTest, ClearAllowsReinsertion) {
  World w;
  SpatialIndex index;
  const EntityId a = w.create();
  ASSERT_TRUE(index.insert(a, Rect{0.0F, 0.0F, 10.0F, 10.0F}));

  index.clear();
  EXPECT_EQ(index.bodyCount(), 0u);
  EXPECT_FALSE(index.contains(a));

  std::vector<EntityId> found;
  index.query(Rect{0.0F, 0.0F, 10.0F, 10.0F}, found);
  EXPECT_TRUE(found.empty());

  EXPECT_TRUE(index.insert(a, Rect{300.0F, 300.0F, 10.0F, 10.0F}));
  index.query(Rect{300.0F, 300.0F, 1.0F, 1.0F}, found);
  ASSERT_EQ(found.size(), 1u);
}

TEST(SpatialIndexTest, CellStorageFollowsMovingBodies) {
  World w;
  SpatialIndex index(64.0F);
  const EntityId mover = w.create();
  const EntityId still = w.create();

  for (int i = 0; i < 500; ++i) {
    index.clear();
    ASSERT_TRUE(index.insert(still, Rect{0.0F, 0.0F, 16.0F, 16.0F}));
    // 40 units per rebuild: crosses a cell boundary every second rebuild or so.
    ASSERT_TRUE(index.insert(mover, Rect{40.0F * static_cast<float>(i), 100.0F, 16.0F, 16.0F}));
    EXPECT_LE(index.occupiedCells(), 3u) << "rebuild " << i;
    EXPECT_LE(index.storedCells(), 6u) << "rebuild " << i;
  }

  std::vector<CandidatePair> pairs;
  index.candidatePairs(pairs);
  EXPECT_TRUE(pairs.empty());
}

TEST(SpatialIndexTest, ReinsertIntoSameCellReportsPairOnce) {
  World w;
  SpatialIndex index;
  const EntityId a = w.create();
  const EntityId b = w.create();
  ASSERT_TRUE(index.insert(a, Rect{0.0F, 0.0F, 10.0F, 10.0F}));
  ASSERT_TRUE(index.remove(a));
  ASSERT_TRUE(index.insert(b, Rect{5.0F, 5.0F, 10.0F, 10.0F}));
  ASSERT_TRUE(index.insert(a, Rect{0.0F, 0.0F, 10.0F, 10.0F}));

  std::vector<CandidatePair> pairs;
  index.candidatePairs(pairs);
  ASSERT_EQ(pairs.size(), 1u);
  EXPECT_EQ(index.occupiedCells(), 1u);
}

TEST(SpatialIndexTest, InvalidCellSizeFallsBackToDefault) {
  SpatialIndex index(0.0F);
  EXPECT_FLOAT_EQ(index.cellSize(), SpatialIndex::kDefaultCellSize);
  index.setCellSize(-3.0F);
  EXPECT_FLOAT_EQ(index.cellSize(), SpatialIndex::kDefaultCellSize);
  index.setCellSize(16.0F);
  EXPECT_FLOAT_EQ(index.cellSize(), 16.0F);
}
