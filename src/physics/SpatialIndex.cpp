#include "physics/SpatialIndex.h"

#include <algorithm>
#include <cmath>

namespace {

// Keeps floor(x / cellSize) inside int range for absurd coordinates.
constexpr double kMaxCellCoord = static_cast<double>(1 << 20);

// A body spanning more cells than this is treated as degenerate geometry.
constexpr long long kMaxCellsPerBody = 1 << 16;

int cellCoord(float v, float invCellSize) {
  const double c = std::floor(static_cast<double>(v) * static_cast<double>(invCellSize));
  return static_cast<int>(std::clamp(c, -kMaxCellCoord, kMaxCellCoord));
}

bool finiteRect(const Rect& r) {
  return std::isfinite(r.x) && std::isfinite(r.y) && std::isfinite(r.w) && std::isfinite(r.h);
}

}  // namespace

SpatialIndex::SpatialIndex(float cellSize) {
  setCellSize(cellSize);
}

void SpatialIndex::setCellSize(float cellSize) {
  if (!(cellSize > 0.0F) || !std::isfinite(cellSize)) {
    cellSize = kDefaultCellSize;
  }
  if (cellSize == cellSize_ && !cells_.empty()) {
    return;
  }
  cellSize_ = cellSize;
  invCellSize_ = 1.0F / cellSize;
  clear();
  cells_.clear();
  previous_.clear();
}

void SpatialIndex::clear() {
  // Cells from the rebuild before that nobody used this time.
  for (const CellKey& key : previous_) {
    auto it = cells_.find(key);
    if (it != cells_.end() && it->second.rebuild != rebuild_) {
      cells_.erase(it);
    }
  }
  for (const CellKey& key : occupied_) {
    auto it = cells_.find(key);
    if (it != cells_.end()) {
      it->second.bodies.clear();
    }
  }
  previous_.swap(occupied_);
  occupied_.clear();
  if (++rebuild_ == 0) {
    rebuild_ = 1;
  }

  for (const Body& b : bodies_) {
    const auto idx = static_cast<std::size_t>(entt::to_entity(b.id));
    if (idx < bodyByEntity_.size()) {
      bodyByEntity_[idx] = kNoBody;
    }
  }
  bodies_.clear();
  liveBodies_ = 0;
}

SpatialIndex::CellRange SpatialIndex::cellRange(const Rect& r) const {
  CellRange out{};
  out.x0 = cellCoord(r.x, invCellSize_);
  out.y0 = cellCoord(r.y, invCellSize_);
  out.x1 = cellCoord(r.right(), invCellSize_);
  out.y1 = cellCoord(r.bottom(), invCellSize_);
  return out;
}

std::uint32_t SpatialIndex::bodyIndex(EntityId id) const {
  if (id == kInvalidEntity) {
    return kNoBody;
  }
  const auto idx = static_cast<std::size_t>(entt::to_entity(id));
  if (idx >= bodyByEntity_.size()) {
    return kNoBody;
  }
  const std::uint32_t n = bodyByEntity_[idx];
  if (n == kNoBody || bodies_[n].id != id || !bodies_[n].live) {
    return kNoBody;
  }
  return n;
}

bool SpatialIndex::insert(EntityId id, const Rect& aabb, std::uint32_t layer, bool noSelfCollision) {
  if (id == kInvalidEntity || !finiteRect(aabb) || !(aabb.w > 0.0F) || !(aabb.h > 0.0F)) {
    return false;
  }
  if (bodyIndex(id) != kNoBody) {
    return false;
  }

  const CellRange range = cellRange(aabb);
  const long long spanned = static_cast<long long>(range.x1 - range.x0 + 1) *
                            static_cast<long long>(range.y1 - range.y0 + 1);
  if (spanned > kMaxCellsPerBody) {
    return false;
  }

  const auto idx = static_cast<std::size_t>(entt::to_entity(id));
  if (idx >= bodyByEntity_.size()) {
    bodyByEntity_.resize(idx + 1, kNoBody);
  }

  const auto n = static_cast<std::uint32_t>(bodies_.size());
  Body body{};
  body.id = id;
  body.aabb = aabb;
  body.cells = range;
  body.layer = layer;
  body.noSelfCollision = noSelfCollision;
  body.live = true;
  bodies_.push_back(body);
  bodyByEntity_[idx] = n;
  ++liveBodies_;

  for (int cy = body.cells.y0; cy <= body.cells.y1; ++cy) {
    for (int cx = body.cells.x0; cx <= body.cells.x1; ++cx) {
      const CellKey key{cx, cy};
      Cell& cell = cells_[key];
      if (cell.rebuild != rebuild_) {
        cell.rebuild = rebuild_;
        cell.bodies.clear();
        occupied_.push_back(key);
      }
      cell.bodies.push_back(n);
    }
  }
  return true;
}

bool SpatialIndex::remove(EntityId id) {
  const std::uint32_t n = bodyIndex(id);
  if (n == kNoBody) {
    return false;
  }

  Body& body = bodies_[n];
  for (int cy = body.cells.y0; cy <= body.cells.y1; ++cy) {
    for (int cx = body.cells.x0; cx <= body.cells.x1; ++cx) {
      auto it = cells_.find(CellKey{cx, cy});
      if (it == cells_.end()) {
        continue;
      }
      auto& list = it->second.bodies;
      auto pos = std::find(list.begin(), list.end(), n);
      if (pos != list.end()) {
        *pos = list.back();
        list.pop_back();
      }
    }
  }

  body.live = false;
  bodyByEntity_[static_cast<std::size_t>(entt::to_entity(id))] = kNoBody;
  --liveBodies_;
  return true;
}

void SpatialIndex::query(const Rect& area, std::vector<EntityId>& out) const {
  if (!finiteRect(area) || area.w < 0.0F || area.h < 0.0F) {
    return;
  }

  if (++queryStamp_ == 0) {
    for (const Body& b : bodies_) {
      b.stamp = 0;
    }
    queryStamp_ = 1;
  }

  const CellRange range = cellRange(area);
  for (int cy = range.y0; cy <= range.y1; ++cy) {
    for (int cx = range.x0; cx <= range.x1; ++cx) {
      auto it = cells_.find(CellKey{cx, cy});
      if (it == cells_.end()) {
        continue;
      }
      for (const std::uint32_t n : it->second.bodies) {
        const Body& b = bodies_[n];
        if (!b.live || b.stamp == queryStamp_) {
          continue;
        }
        b.stamp = queryStamp_;
        out.push_back(b.id);
      }
    }
  }
}

void SpatialIndex::candidatePairs(std::vector<CandidatePair>& out) const {
  const std::size_t first = out.size();

  for (const CellKey& key : occupied_) {
    auto it = cells_.find(key);
    if (it == cells_.end()) {
      continue;
    }
    const std::vector<std::uint32_t>& list = it->second.bodies;
    for (std::size_t i = 0; i < list.size(); ++i) {
      const Body& a = bodies_[list[i]];
      if (!a.live) {
        continue;
      }
      for (std::size_t j = i + 1; j < list.size(); ++j) {
        const Body& b = bodies_[list[j]];
        if (!b.live) {
          continue;
        }
        // Report the pair only from the first cell the two ranges share.
        const CellKey shared{std::max(a.cells.x0, b.cells.x0), std::max(a.cells.y0, b.cells.y0)};
        if (shared != key) {
          continue;
        }
        if (a.noSelfCollision && b.noSelfCollision && a.layer == b.layer) {
          continue;
        }
        if (entityLess(a.id, b.id)) {
          out.push_back(CandidatePair{a.id, b.id});
        } else {
          out.push_back(CandidatePair{b.id, a.id});
        }
      }
    }
  }

  // Cell iteration order is a hash-map detail; keep resolution order stable.
  std::sort(out.begin() + static_cast<std::ptrdiff_t>(first), out.end(),
            [](const CandidatePair& l, const CandidatePair& r) {
              if (l.a != r.a) {
                return entityLess(l.a, r.a);
              }
              return entityLess(l.b, r.b);
            });
}

bool SpatialIndex::contains(EntityId id) const {
  return bodyIndex(id) != kNoBody;
}

std::size_t SpatialIndex::cellCount(EntityId id) const {
  const std::uint32_t n = bodyIndex(id);
  if (n == kNoBody) {
    return 0;
  }
  const CellRange& c = bodies_[n].cells;
  return static_cast<std::size_t>(c.x1 - c.x0 + 1) * static_cast<std::size_t>(c.y1 - c.y0 + 1);
}
