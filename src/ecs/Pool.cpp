#include "ecs/Pool.h"

#include <cassert>
#include <utility>

#include "core/Log.h"
#include "ecs/World.h"

ObjectPool::ObjectPool(World& w, std::size_t capacity, std::uint16_t index)
    : world_(&w), index_(index) {
  slots_.reserve(capacity);
  active_.assign(capacity, false);
  free_.reserve(capacity);

  for (std::size_t i = 0; i < capacity; ++i) {
    const EntityId e = world_->create();
    world_->resetComponents(e);
    world_->registry.emplace<Dormant>(e);
    world_->registry.emplace<PoolSlot>(e, index_, static_cast<std::uint32_t>(i));
    slots_.push_back(e);
  }

  // Hand out slot 0 first.
  for (std::size_t i = capacity; i > 0; --i) {
    free_.push_back(static_cast<std::uint32_t>(i - 1));
  }
}

std::optional<EntityId> ObjectPool::acquire() {
  if (free_.empty()) {
    return std::nullopt;
  }

  const std::uint32_t slot = free_.back();
  const EntityId id = slots_[slot];
  if (!world_->valid(id)) {
    assert(false && "pool slot refers to an entity missing from the store");
    return std::nullopt;
  }

  free_.pop_back();
  active_[slot] = true;
  world_->registry.remove<Dormant>(id);
  return id;
}

bool ObjectPool::release(EntityId id) {
  const auto slot = slotOf(id);
  if (!slot || !active_[*slot]) {
    return false;
  }

  world_->resetComponents(id);
  world_->registry.emplace_or_replace<Dormant>(id);
  active_[*slot] = false;
  free_.push_back(*slot);
  return true;
}

bool ObjectPool::isActive(EntityId id) const {
  const auto slot = slotOf(id);
  return slot && active_[*slot];
}

std::optional<std::uint32_t> ObjectPool::slotOf(EntityId id) const {
  if (!world_->valid(id)) {
    return std::nullopt;
  }
  const auto* ps = world_->registry.try_get<PoolSlot>(id);
  if (ps == nullptr || ps->pool != index_ || ps->slot >= slots_.size() ||
      slots_[ps->slot] != id) {
    return std::nullopt;
  }
  return ps->slot;
}

int ObjectPools::add(std::string name, std::size_t capacity, const PoolTemplate& tmpl) {
  if (indexOf(name) >= 0) {
    Log::warnf("pool", "duplicate pool name '{}'", name);
    return -1;
  }
  const auto index = static_cast<std::uint16_t>(entries_.size());
  entries_.push_back(Entry{std::move(name), tmpl, ObjectPool(*world_, capacity, index)});
  return static_cast<int>(index);
}

int ObjectPools::indexOf(std::string_view name) const {
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].name == name) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

ObjectPool* ObjectPools::get(int index) {
  if (index < 0 || static_cast<std::size_t>(index) >= entries_.size()) {
    return nullptr;
  }
  return &entries_[static_cast<std::size_t>(index)].pool;
}

const ObjectPool* ObjectPools::get(int index) const {
  if (index < 0 || static_cast<std::size_t>(index) >= entries_.size()) {
    return nullptr;
  }
  return &entries_[static_cast<std::size_t>(index)].pool;
}

const std::string& ObjectPools::name(int index) const {
  static const std::string kEmpty;
  if (index < 0 || static_cast<std::size_t>(index) >= entries_.size()) {
    return kEmpty;
  }
  return entries_[static_cast<std::size_t>(index)].name;
}

std::optional<EntityId> ObjectPools::spawn(int index, Vec2 pos, Vec2 velocity) {
  ObjectPool* pool = get(index);
  if (pool == nullptr) {
    return std::nullopt;
  }

  const auto id = pool->acquire();
  if (!id) {
    return std::nullopt;
  }

  const PoolTemplate& tmpl = entries_[static_cast<std::size_t>(index)].tmpl;
  auto& reg = world_->registry;
  reg.replace<Transform>(*id, Transform{pos});

  PhysicsBody body = tmpl.body;
  body.velocity = velocity;
  reg.replace<PhysicsBody>(*id, body);
  reg.replace<Behavior>(*id, Behavior{tmpl.behavior});
  reg.replace<Lifetime>(*id, Lifetime{tmpl.lifetime});
  if (tmpl.visual.valid()) {
    reg.emplace_or_replace<Visual>(*id, Visual{tmpl.visual});
  }
  return id;
}

bool ObjectPools::release(EntityId id) {
  if (!world_->valid(id)) {
    return false;
  }
  const auto* ps = world_->registry.try_get<PoolSlot>(id);
  if (ps == nullptr) {
    return false;
  }
  ObjectPool* pool = get(ps->pool);
  if (pool == nullptr) {
    assert(false && "pooled entity refers to an unknown pool");
    return false;
  }
  return pool->release(id);
}
