#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ecs/Components.h"
#include "ecs/Entity.h"

struct CandidatePair {
  EntityId a = kInvalidEntity;
  EntityId b = kInvalidEntity;
};

// Uniform-grid broad phase.
//
// Cell key is (floor(x / cellSize), floor(y / cellSize)); a body is listed in every cell its
// bounds touch. Intended usage is a full rebuild every step:
//   index.clear();
//   for each body: index.insert(id, aabb, layer, noSelfCollision);
//   index.candidatePairs(pairs);
// Cell and body vectors keep their capacity across clear(), so steady-state rebuilds do not
// allocate. A cell left empty for a whole rebuild is dropped; the map only holds cells used by
// the current or the previous rebuild, and pair generation walks only the current ones.
class SpatialIndex {
 public:
  static constexpr float kDefaultCellSize = 64.0F;

  explicit SpatialIndex(float cellSize = kDefaultCellSize);

  void clear();
  void setCellSize(float cellSize);

  // False (and nothing inserted) for non-finite or zero-area bounds, bounds spanning an
  // unreasonable number of cells, or an id that is already present.
  bool insert(EntityId id, const Rect& aabb, std::uint32_t layer = 0, bool noSelfCollision = false);
  bool remove(EntityId id);

  // Appends every body whose cells intersect `area`, each once. Superset of true overlaps.
  void query(const Rect& area, std::vector<EntityId>& out) const;

  // Appends each pair of bodies sharing at least one cell, each pair once.
  // Pairs on the same layer where both bodies opt out of self-collision are skipped.
  void candidatePairs(std::vector<CandidatePair>& out) const;

  [[nodiscard]] bool contains(EntityId id) const;
  [[nodiscard]] float cellSize() const { return cellSize_; }
  [[nodiscard]] std::size_t bodyCount() const { return liveBodies_; }
  [[nodiscard]] std::size_t cellCount(EntityId id) const;
  [[nodiscard]] std::size_t occupiedCells() const { return occupied_.size(); }
  [[nodiscard]] std::size_t storedCells() const { return cells_.size(); }

 private:
  struct CellKey {
    int x = 0;
    int y = 0;
    bool operator==(const CellKey&) const = default;
  };

  struct CellKeyHash {
    std::size_t operator()(const CellKey& c) const noexcept {
      return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.x))
                                         << 32U) ^
                                        static_cast<std::uint32_t>(c.y));
    }
  };

  struct Cell {
    std::vector<std::uint32_t> bodies;
    std::uint32_t rebuild = 0;  // last rebuild that inserted here
  };

  struct CellRange {
    int x0 = 0;
    int y0 = 0;
    int x1 = -1;
    int y1 = -1;
  };

  struct Body {
    EntityId id = kInvalidEntity;
    Rect aabb{};
    CellRange cells{};
    std::uint32_t layer = 0;
    bool noSelfCollision = false;
    bool live = false;
    mutable std::uint32_t stamp = 0;
  };

  static constexpr std::uint32_t kNoBody = 0xFFFFFFFFU;

  [[nodiscard]] CellRange cellRange(const Rect& r) const;
  [[nodiscard]] std::uint32_t bodyIndex(EntityId id) const;

  float cellSize_ = kDefaultCellSize;
  float invCellSize_ = 1.0F / kDefaultCellSize;

  std::unordered_map<CellKey, Cell, CellKeyHash> cells_;
  std::vector<CellKey> occupied_;  // this rebuild, each key once
  std::vector<CellKey> previous_;  // the rebuild before
  std::uint32_t rebuild_ = 1;
  std::vector<Body> bodies_;
  std::vector<std::uint32_t> bodyByEntity_;  // indexed by entt entity index
  std::size_t liveBodies_ = 0;
  mutable std::uint32_t queryStamp_ = 0;
};
