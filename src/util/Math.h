#pragma once

#include <cmath>

#include "ecs/Components.h"

namespace util {

inline float dot(Vec2 a, Vec2 b) {
  return a.x * b.x + a.y * b.y;
}

inline bool finite(Vec2 v) {
  return std::isfinite(v.x) && std::isfinite(v.y);
}

inline bool finite(const Rect& r) {
  return std::isfinite(r.x) && std::isfinite(r.y) && std::isfinite(r.w) && std::isfinite(r.h);
}

inline Rect inflate(const Rect& r, float by) {
  return Rect{r.x - by, r.y - by, r.w + by * 2.0F, r.h + by * 2.0F};
}

// Strict overlap; rectangles that only share an edge do not overlap.
inline bool overlaps(const Rect& a, const Rect& b) {
  return a.x < b.right() && b.x < a.right() && a.y < b.bottom() && b.y < a.bottom();
}

}  // namespace util
