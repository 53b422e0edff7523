#include "sim/SimConfig.h"

#include <cmath>
#include <string>

#include <toml++/toml.h>
#include "util/TomlUtil.h"

namespace {

constexpr int kMaxTickRate = 1000;
constexpr int kMaxSubStepsLimit = 64;

}  // namespace

bool SimConfig::loadFromToml(const char* path) {
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

  TomlUtil::warnUnknownKeys(tbl, path, "root", {"time", "physics", "broadphase", "assets"});

  if (auto t = tbl["time"].as_table()) {
    TomlUtil::warnUnknownKeys(*t, path, "time", {"tick_rate", "max_sub_steps"});
    TomlUtil::readInt(*t, path, "time", "tick_rate", time.tickRate);
    TomlUtil::readInt(*t, path, "time", "max_sub_steps", time.maxSubSteps);
  }

  if (auto p = tbl["physics"].as_table()) {
    TomlUtil::warnUnknownKeys(*p, path, "physics",
                              {"gravity", "max_speed", "contact_skin", "restitution"});
    TomlUtil::readFloat(*p, path, "physics", "gravity", physics.gravity);
    TomlUtil::readFloat(*p, path, "physics", "max_speed", physics.maxSpeed);
    TomlUtil::readFloat(*p, path, "physics", "contact_skin", physics.contactSkin);
    TomlUtil::readFloat(*p, path, "physics", "restitution", physics.restitution);
  }

  if (auto b = tbl["broadphase"].as_table()) {
    TomlUtil::warnUnknownKeys(*b, path, "broadphase", {"cell_size"});
    TomlUtil::readFloat(*b, path, "broadphase", "cell_size", broadphase.cellSize);
  }

  if (auto a = tbl["assets"].as_table()) {
    TomlUtil::warnUnknownKeys(*a, path, "assets", {"capacity"});
    int capacity = static_cast<int>(assets.capacity);
    TomlUtil::readInt(*a, path, "assets", "capacity", capacity);
    if (capacity <= 0) {
      TomlUtil::warnf(path, "assets.capacity must be > 0; keeping {}", assets.capacity);
    } else {
      assets.capacity = static_cast<std::size_t>(capacity);
    }
  }

  if (time.tickRate <= 0 || time.tickRate > kMaxTickRate) {
    TomlUtil::warnf(path, "time.tick_rate must be in [1, {}]; using 120", kMaxTickRate);
    time.tickRate = 120;
  }
  if (time.maxSubSteps <= 0 || time.maxSubSteps > kMaxSubStepsLimit) {
    TomlUtil::warnf(path, "time.max_sub_steps must be in [1, {}]; using 8", kMaxSubStepsLimit);
    time.maxSubSteps = 8;
  }
  if (!(physics.maxSpeed > 0.0F) || !std::isfinite(physics.maxSpeed)) {
    TomlUtil::warnf(path, "physics.max_speed must be > 0; using default");
    physics.maxSpeed = PhysicsConfig::kDefaultMaxSpeed;
  }
  if (!std::isfinite(physics.gravity)) {
    TomlUtil::warnf(path, "physics.gravity must be finite; using default");
    physics.gravity = PhysicsConfig::kDefaultGravity;
  }
  if (!(physics.contactSkin >= 0.0F) || !std::isfinite(physics.contactSkin)) {
    TomlUtil::warnf(path, "physics.contact_skin must be >= 0; using default");
    physics.contactSkin = PhysicsConfig::kDefaultContactSkin;
  }
  if (!(physics.restitution >= 0.0F && physics.restitution <= 1.0F)) {
    TomlUtil::warnf(path, "physics.restitution must be in [0, 1]; using 0");
    physics.restitution = PhysicsConfig::kDefaultRestitution;
  }
  if (!(broadphase.cellSize > 0.0F) || !std::isfinite(broadphase.cellSize)) {
    TomlUtil::warnf(path, "broadphase.cell_size must be > 0; using 64");
    broadphase.cellSize = 64.0F;
  }
  return true;
}
