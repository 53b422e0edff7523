#include "sim/Scene.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

#include <toml++/toml.h>
#include "util/TomlUtil.h"

bool parseBodyKind(std::string_view s, BodyKind& out) {
  if (s == "static") {
    out = BodyKind::Static;
    return true;
  }
  if (s == "dynamic") {
    out = BodyKind::Dynamic;
    return true;
  }
  if (s == "trigger") {
    out = BodyKind::Trigger;
    return true;
  }
  return false;
}

bool parseBehaviorKind(std::string_view s, BehaviorKind& out) {
  if (s == "none") {
    out = BehaviorKind::None;
    return true;
  }
  if (s == "platformer") {
    out = BehaviorKind::Platformer;
    return true;
  }
  if (s == "projectile") {
    out = BehaviorKind::Projectile;
    return true;
  }
  return false;
}

namespace {

// Reads a [*.body] table into `body`. False when the resulting box has no area.
bool readBody(const toml::table& t, const char* path, const std::string& scope, PhysicsBody& body) {
  TomlUtil::warnUnknownKeys(t, path, scope,
                            {"kind", "w", "h", "offset_x", "offset_y", "layer", "mask", "mass",
                             "gravity_scale", "no_self_collision", "despawn_on_contact", "vx",
                             "vy"});

  std::string kind = "dynamic";
  TomlUtil::readString(t, path, scope, "kind", kind);
  if (!parseBodyKind(kind, body.kind)) {
    TomlUtil::warnf(path, "{}.kind should be 'static', 'dynamic' or 'trigger' (got '{}')", scope,
                    kind);
  }

  TomlUtil::readFloat(t, path, scope, "w", body.size.x);
  TomlUtil::readFloat(t, path, scope, "h", body.size.y);
  TomlUtil::readFloat(t, path, scope, "offset_x", body.offset.x);
  TomlUtil::readFloat(t, path, scope, "offset_y", body.offset.y);
  TomlUtil::readMask(t, path, scope, "layer", body.layer);
  TomlUtil::readMask(t, path, scope, "mask", body.mask);
  TomlUtil::readFloat(t, path, scope, "mass", body.mass);
  TomlUtil::readFloat(t, path, scope, "gravity_scale", body.gravityScale);
  TomlUtil::readBool(t, path, scope, "no_self_collision", body.noSelfCollision);
  TomlUtil::readBool(t, path, scope, "despawn_on_contact", body.despawnOnContact);
  TomlUtil::readFloat(t, path, scope, "vx", body.velocity.x);
  TomlUtil::readFloat(t, path, scope, "vy", body.velocity.y);

  if (!(body.mass > 0.0F)) {
    TomlUtil::warnf(path, "{}.mass must be > 0; using 1", scope);
    body.mass = 1.0F;
  }
  if (!(body.size.x > 0.0F) || !(body.size.y > 0.0F)) {
    TomlUtil::warnf(path, "{} has invalid size (w={:.3F} h={:.3F}); skipping", scope,
                    body.size.x, body.size.y);
    return false;
  }
  return true;
}

}  // namespace

// NOLINTBEGIN(readability-function-cognitive-complexity)
bool SceneDesc::loadFromToml(const char* path) {
  if (path == nullptr || path[0] == '\0') {
    return false;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(path);
  } catch (const toml::parse_error& err) {
    TomlUtil::reportParseError(path, err);
    return false;
  }

  TomlUtil::warnUnknownKeys(tbl, path, "root", {"version", "scene", "pools", "entities"});

  const std::filesystem::path baseDir = std::filesystem::path(path).parent_path();

  int nextVersion = 0;
  std::string nextId = std::filesystem::path(path).stem().string();
  std::string nextDisplay;
  std::vector<EntityDesc> nextEntities;
  std::vector<PoolDesc> nextPools;

  if (auto v = tbl["version"].value<int>()) {
    nextVersion = *v;
  }

  if (auto sc = tbl["scene"].as_table()) {
    TomlUtil::warnUnknownKeys(*sc, path, "scene", {"id", "display"});
    TomlUtil::readString(*sc, path, "scene", "id", nextId);
    TomlUtil::readString(*sc, path, "scene", "display", nextDisplay);
  }
  if (nextDisplay.empty()) {
    nextDisplay = nextId;
  }

  if (auto pools = tbl["pools"].as_array()) {
    std::unordered_set<std::string> names;
    std::size_t idx = 0;
    for (const auto& node : *pools) {
      const std::string scope = "pools[" + std::to_string(idx) + "]";
      ++idx;
      auto t = node.as_table();
      if (!t) {
        TomlUtil::warnf(path, "{} must be a table", scope);
        continue;
      }
      TomlUtil::warnUnknownKeys(*t, path, scope,
                                {"name", "capacity", "sprite", "lifetime", "body"});

      PoolDesc pool{};
      TomlUtil::readString(*t, path, scope, "name", pool.name);
      if (pool.name.empty()) {
        TomlUtil::warnf(path, "{} is missing a name; skipping", scope);
        continue;
      }
      if (!names.insert(pool.name).second) {
        TomlUtil::warnf(path, "{} duplicates pool name '{}'; skipping", scope, pool.name);
        continue;
      }

      int capacity = 0;
      TomlUtil::readInt(*t, path, scope, "capacity", capacity);
      if (capacity <= 0 || static_cast<std::size_t>(capacity) > kMaxPoolCapacity) {
        TomlUtil::warnf(path, "{}.capacity must be in [1, {}]; skipping", scope, kMaxPoolCapacity);
        continue;
      }
      pool.capacity = static_cast<std::size_t>(capacity);

      TomlUtil::readString(*t, path, scope, "sprite", pool.sprite);
      TomlUtil::readFloat(*t, path, scope, "lifetime", pool.lifetime);

      auto body = (*t)["body"].as_table();
      if (!body) {
        TomlUtil::warnf(path, "{} is missing [body]; skipping", scope);
        continue;
      }
      if (!readBody(*body, path, scope + ".body", pool.body)) {
        continue;
      }
      nextPools.push_back(std::move(pool));
    }
  }

  if (auto entities = tbl["entities"].as_array()) {
    std::size_t idx = 0;
    for (const auto& node : *entities) {
      const std::string scope = "entities[" + std::to_string(idx) + "]";
      ++idx;
      auto t = node.as_table();
      if (!t) {
        TomlUtil::warnf(path, "{} must be a table", scope);
        continue;
      }
      TomlUtil::warnUnknownKeys(*t, path, scope,
                                {"name", "x", "y", "rotation", "scale_x", "scale_y", "behavior",
                                 "character", "sprite", "lifetime", "player", "body"});

      EntityDesc e{};
      TomlUtil::readString(*t, path, scope, "name", e.name);
      TomlUtil::readFloat(*t, path, scope, "x", e.transform.pos.x);
      TomlUtil::readFloat(*t, path, scope, "y", e.transform.pos.y);
      TomlUtil::readFloat(*t, path, scope, "rotation", e.transform.rotation);
      TomlUtil::readFloat(*t, path, scope, "scale_x", e.transform.scale.x);
      TomlUtil::readFloat(*t, path, scope, "scale_y", e.transform.scale.y);
      TomlUtil::readString(*t, path, scope, "sprite", e.sprite);
      TomlUtil::readFloat(*t, path, scope, "lifetime", e.lifetime);
      TomlUtil::readBool(*t, path, scope, "player", e.player);

      std::string behavior = "none";
      TomlUtil::readString(*t, path, scope, "behavior", behavior);
      if (!parseBehaviorKind(behavior, e.behavior)) {
        TomlUtil::warnf(path, "{}.behavior should be 'none', 'platformer' or 'projectile' (got '{}')",
                        scope, behavior);
      }

      if (auto body = (*t)["body"].as_table()) {
        e.hasBody = readBody(*body, path, scope + ".body", e.body);
      }

      TomlUtil::readString(*t, path, scope, "character", e.characterPath);
      if (!e.characterPath.empty()) {
        e.characterPath = (baseDir / e.characterPath).lexically_normal().string();
        if (!e.platformer.loadFromToml(e.characterPath.c_str())) {
          TomlUtil::warnf(path, "{}: failed to load character '{}'; using defaults", scope,
                          e.characterPath);
          e.platformer = PlatformerConfig{};
        }
      }
      if (e.behavior == BehaviorKind::Platformer && e.name.empty()) {
        e.name = e.platformer.displayName;
      }

      nextEntities.push_back(std::move(e));
    }
  }

  version = nextVersion;
  id = std::move(nextId);
  displayName = std::move(nextDisplay);
  entities = std::move(nextEntities);
  pools = std::move(nextPools);
  return true;
}
// NOLINTEND(readability-function-cognitive-complexity)
