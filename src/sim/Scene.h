#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "character/PlatformerConfig.h"
#include "ecs/Components.h"

// Deserialized scene document. Everything here is plain data; Simulation::loadScene turns it
// into entities, pools and resolved asset handles.
struct EntityDesc {
  std::string name;
  Transform transform{};
  bool hasBody = false;
  PhysicsBody body{};
  BehaviorKind behavior = BehaviorKind::None;
  std::string characterPath;  // source of `platformer`, informational once loaded
  PlatformerConfig platformer{};
  std::string sprite;  // asset reference, empty for none
  float lifetime = 0.0F;
  bool player = false;  // receives the frame's input snapshot
};

struct PoolDesc {
  std::string name;
  std::size_t capacity = 0;
  PhysicsBody body{};
  std::string sprite;
  float lifetime = 0.0F;
};

struct SceneDesc {
  static constexpr std::size_t kMaxPoolCapacity = 4096;

  int version = 0;
  std::string id;
  std::string displayName;
  std::vector<EntityDesc> entities;
  std::vector<PoolDesc> pools;

  // Character files are resolved relative to the scene file and loaded here.
  bool loadFromToml(const char* path);
};

bool parseBodyKind(std::string_view s, BodyKind& out);
bool parseBehaviorKind(std::string_view s, BehaviorKind& out);
