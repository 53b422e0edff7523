#pragma once

#include <cstdint>

#include <entt/entt.hpp>

using EntityId = entt::entity;
inline constexpr EntityId kInvalidEntity = entt::null;

// Stable integral key; pair lists and render lists are ordered by it.
inline std::uint32_t entityKey(EntityId e) {
  return static_cast<std::uint32_t>(entt::to_integral(e));
}

inline bool entityLess(EntityId a, EntityId b) {
  return entityKey(a) < entityKey(b);
}
