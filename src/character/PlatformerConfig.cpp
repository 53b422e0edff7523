#include "character/PlatformerConfig.h"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_set>

#include <toml++/toml.h>
#include "util/TomlUtil.h"

// NOLINTBEGIN(readability-function-cognitive-complexity)
bool PlatformerConfig::loadFromToml(const char* path) {
  if (path == nullptr || path[0] == '\0') {
    return false;
  }

  std::unordered_set<std::string> seen;
  auto appendFromToml = [&](auto&& self, const std::filesystem::path& filePath) -> bool {
    const std::filesystem::path normalized = filePath.lexically_normal();
    const std::string pathStr = normalized.string();
    if (pathStr.empty()) {
      return false;
    }

    if (!seen.insert(pathStr).second) {
      TomlUtil::warnf(pathStr.c_str(), "character config include cycle detected; skipping");
      return true;
    }

    toml::table tbl;
    try {
      tbl = toml::parse_file(pathStr);
    } catch (const toml::parse_error& err) {
      TomlUtil::reportParseError(pathStr.c_str(), err);
      return false;
    }

    TomlUtil::warnUnknownKeys(tbl, pathStr.c_str(), "root",
                              {"version", "name", "move", "jump", "shoot", "audio", "include"});

    if (auto include = tbl["include"].value<std::string>()) {
      if (!self(self, normalized.parent_path() / *include)) {
        return false;
      }
    } else if (auto includes = tbl["include"].as_array()) {
      std::size_t idx = 0;
      for (const auto& node : *includes) {
        if (auto includePathStr = node.value<std::string>()) {
          if (!self(self, normalized.parent_path() / *includePathStr)) {
            return false;
          }
        } else {
          TomlUtil::warnf(pathStr.c_str(), "include[{}] must be a string path", idx);
        }
        ++idx;
      }
    } else if (tbl.contains("include")) {
      TomlUtil::warnf(pathStr.c_str(), "include must be a string path or array of paths");
    }

    const char* path = pathStr.c_str();

    if (auto v = tbl["version"].value<int>()) {
      version = *v;
    }

    if (auto n = tbl["name"].as_table()) {
      TomlUtil::warnUnknownKeys(*n, path, "name", {"id", "display"});
      TomlUtil::readString(*n, path, "name", "id", id);
      TomlUtil::readString(*n, path, "name", "display", displayName);
    }

    if (auto m = tbl["move"].as_table()) {
      TomlUtil::warnUnknownKeys(*m, path, "move", {"max_speed", "friction", "stop_speed"});
      TomlUtil::readFloat(*m, path, "move", "max_speed", move.maxSpeed);
      TomlUtil::readFloat(*m, path, "move", "friction", move.friction);
      TomlUtil::readFloat(*m, path, "move", "stop_speed", move.stopSpeed);
    }

    if (auto j = tbl["jump"].as_table()) {
      TomlUtil::warnUnknownKeys(*j, path, "jump", {"impulse", "coyote_time", "jump_buffer_time"});
      TomlUtil::readFloat(*j, path, "jump", "impulse", jump.impulse);
      TomlUtil::readFloat(*j, path, "jump", "coyote_time", jump.coyoteTime);
      TomlUtil::readFloat(*j, path, "jump", "jump_buffer_time", jump.jumpBufferTime);
    }

    if (auto s = tbl["shoot"].as_table()) {
      TomlUtil::warnUnknownKeys(*s, path, "shoot",
                                {"enabled", "pool", "speed", "offset_x", "offset_y", "cooldown"});
      TomlUtil::readBool(*s, path, "shoot", "enabled", shoot.enabled);
      TomlUtil::readString(*s, path, "shoot", "pool", shoot.pool);
      TomlUtil::readFloat(*s, path, "shoot", "speed", shoot.speed);
      TomlUtil::readFloat(*s, path, "shoot", "offset_x", shoot.offsetX);
      TomlUtil::readFloat(*s, path, "shoot", "offset_y", shoot.offsetY);
      TomlUtil::readFloat(*s, path, "shoot", "cooldown", shoot.cooldown);
    }

    if (auto a = tbl["audio"].as_table()) {
      TomlUtil::warnUnknownKeys(*a, path, "audio", {"jump", "land", "shoot"});
      TomlUtil::readString(*a, path, "audio", "jump", audio.jump);
      TomlUtil::readString(*a, path, "audio", "land", audio.land);
      TomlUtil::readString(*a, path, "audio", "shoot", audio.shoot);
    }

    return true;
  };

  if (!appendFromToml(appendFromToml, std::filesystem::path(path))) {
    return false;
  }

  if (displayName.empty()) {
    displayName = id;
  }

  const char* root = path;
  if (move.maxSpeed < 0.0F) {
    TomlUtil::warnf(root, "move.max_speed must be >= 0; using 0");
    move.maxSpeed = 0.0F;
  }
  if (move.friction < 0.0F || move.friction > 1.0F) {
    TomlUtil::warnf(root, "move.friction must be in [0, 1]; clamping");
    move.friction = std::clamp(move.friction, 0.0F, 1.0F);
  }
  move.stopSpeed = std::max(move.stopSpeed, 0.0F);
  jump.coyoteTime = std::max(jump.coyoteTime, 0.0F);
  jump.jumpBufferTime = std::max(jump.jumpBufferTime, 0.0F);
  shoot.cooldown = std::max(shoot.cooldown, 0.0F);
  if (shoot.enabled && shoot.pool.empty()) {
    TomlUtil::warnf(root, "shoot.enabled without shoot.pool; shooting disabled");
    shoot.enabled = false;
  }
  return true;
}
// NOLINTEND(readability-function-cognitive-complexity)
