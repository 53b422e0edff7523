#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/Assets.h"
#include "ecs/Components.h"
#include "ecs/Entity.h"

class World;

// Fixed-capacity slot allocator for short-lived entities (projectiles, particles).
//
// Every slot's entity is created up front and parked with the Dormant tag, so steady-state
// spawning never creates or destroys store entities. A full pool rejects acquire() instead
// of evicting a live slot.
class ObjectPool {
 public:
  ObjectPool(World& w, std::size_t capacity, std::uint16_t index);

  ObjectPool(const ObjectPool&) = delete;
  ObjectPool& operator=(const ObjectPool&) = delete;
  ObjectPool(ObjectPool&&) noexcept = default;
  ObjectPool& operator=(ObjectPool&&) noexcept = default;

  // nullopt when every slot is active.
  [[nodiscard]] std::optional<EntityId> acquire();

  // Resets the slot's components to defaults and returns it to the free list.
  // False for ids this pool does not own or that are not active.
  bool release(EntityId id);

  [[nodiscard]] bool isActive(EntityId id) const;
  [[nodiscard]] std::size_t capacity() const { return slots_.size(); }
  [[nodiscard]] std::size_t activeCount() const { return slots_.size() - free_.size(); }
  [[nodiscard]] std::size_t freeCount() const { return free_.size(); }
  [[nodiscard]] std::uint16_t index() const { return index_; }

 private:
  [[nodiscard]] std::optional<std::uint32_t> slotOf(EntityId id) const;

  World* world_ = nullptr;
  std::uint16_t index_ = 0;
  std::vector<EntityId> slots_;
  std::vector<bool> active_;
  std::vector<std::uint32_t> free_;  // LIFO
};

// What a pooled entity looks like when spawned.
struct PoolTemplate {
  PhysicsBody body{};
  BehaviorKind behavior = BehaviorKind::Projectile;
  float lifetime = 0.0F;
  AssetHandle visual{};
};

// The scene's named pools.
class ObjectPools {
 public:
  explicit ObjectPools(World& w) : world_(&w) {}

  // Returns the new pool's index. Names are unique; re-adding a name returns -1.
  int add(std::string name, std::size_t capacity, const PoolTemplate& tmpl);
  void clear() { entries_.clear(); }

  [[nodiscard]] int indexOf(std::string_view name) const;
  [[nodiscard]] ObjectPool* get(int index);
  [[nodiscard]] const ObjectPool* get(int index) const;
  [[nodiscard]] const std::string& name(int index) const;
  [[nodiscard]] std::size_t size() const { return entries_.size(); }

  // Acquire from pool `index` and apply its template. nullopt when the pool is full.
  std::optional<EntityId> spawn(int index, Vec2 pos, Vec2 velocity);

  // Release a pooled entity to whichever pool owns it.
  bool release(EntityId id);

 private:
  struct Entry {
    std::string name;
    PoolTemplate tmpl;
    ObjectPool pool;
  };

  World* world_ = nullptr;
  std::vector<Entry> entries_;
};
