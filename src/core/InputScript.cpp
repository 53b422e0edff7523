#include "core/InputScript.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <toml++/toml.h>

#include "util/TomlUtil.h"

namespace {

void readButton(const toml::table& t,
                const char* path,
                const std::string& scope,
                std::string_view key,
                std::uint32_t bit,
                std::uint32_t& mask,
                bool& out) {
  if (!t.contains(key)) {
    return;
  }
  mask |= bit;
  TomlUtil::readBool(t, path, scope, key, out);
}

}  // namespace

bool InputScript::appendFromToml(const std::filesystem::path& path,
                                 std::unordered_set<std::string>& seen) {
  const std::filesystem::path normalized = path.lexically_normal();
  const std::string pathStr = normalized.string();
  if (pathStr.empty()) {
    return false;
  }

  if (!seen.insert(pathStr).second) {
    TomlUtil::warnf(pathStr.c_str(), "input script include cycle detected; skipping");
    return true;
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(pathStr);
  } catch (const toml::parse_error& err) {
    TomlUtil::reportParseError(pathStr.c_str(), err);
    return false;
  }

  const char* file = pathStr.c_str();
  TomlUtil::warnUnknownKeys(tbl, file, "root", {"version", "keyframes", "include"});

  int version = 1;
  if (auto v = tbl["version"].value<int>()) {
    version = *v;
  }
  if (version != 1) {
    TomlUtil::warnf(file, "input script version {} (expected 1)", version);
  }

  if (auto include = tbl["include"].value<std::string>()) {
    if (!appendFromToml(normalized.parent_path() / *include, seen)) {
      return false;
    }
  } else if (tbl.contains("include")) {
    TomlUtil::warnf(file, "include must be a string path");
  }

  auto frames = tbl["keyframes"].as_array();
  if (!frames) {
    return true;
  }

  std::size_t idx = 0;
  for (const auto& node : *frames) {
    const std::string scope = "keyframes[" + std::to_string(idx) + "]";
    ++idx;
    auto t = node.as_table();
    if (!t) {
      TomlUtil::warnf(file, "{} must be a table", scope);
      continue;
    }
    TomlUtil::warnUnknownKeys(*t, file, scope, {"frame", "left", "right", "jump", "action"});

    int frame = -1;
    TomlUtil::readInt(*t, file, scope, "frame", frame);
    if (frame < 0) {
      TomlUtil::warnf(file, "{} missing frame (use frame = N)", scope);
      continue;
    }

    Keyframe kf{};
    kf.frame = static_cast<std::uint64_t>(frame);
    readButton(*t, file, scope, "left", kLeft, kf.mask, kf.values.left);
    readButton(*t, file, scope, "right", kRight, kf.mask, kf.values.right);
    readButton(*t, file, scope, "jump", kJump, kf.mask, kf.values.jump);
    readButton(*t, file, scope, "action", kAction, kf.mask, kf.values.action);
    keyframes_.push_back(kf);
  }
  return true;
}

bool InputScript::loadFromToml(const char* path) {
  keyframes_.clear();
  reset();
  loaded_ = false;
  path_ = (path != nullptr) ? path : "";
  if (path_.empty()) {
    return false;
  }

  std::unordered_set<std::string> seen;
  if (!appendFromToml(path_, seen)) {
    return false;
  }

  std::stable_sort(keyframes_.begin(), keyframes_.end(),
                   [](const Keyframe& a, const Keyframe& b) { return a.frame < b.frame; });

  loaded_ = true;
  return true;
}

void InputScript::reset() {
  held_ = Held{};
  prevHeld_ = Held{};
  nextIndex_ = 0;
  lastFrame_ = 0;
  hasLastFrame_ = false;
}

InputState InputScript::sample(std::uint64_t frame) {
  if (!loaded_) {
    return InputState{};
  }

  // Seeking backwards replays from the start.
  if (!hasLastFrame_ || frame < lastFrame_) {
    reset();
  }

  while (nextIndex_ < keyframes_.size() && keyframes_[nextIndex_].frame <= frame) {
    const Keyframe& kf = keyframes_[nextIndex_];
    if ((kf.mask & kLeft) != 0U) {
      held_.left = kf.values.left;
    }
    if ((kf.mask & kRight) != 0U) {
      held_.right = kf.values.right;
    }
    if ((kf.mask & kJump) != 0U) {
      held_.jump = kf.values.jump;
    }
    if ((kf.mask & kAction) != 0U) {
      held_.action = kf.values.action;
    }
    ++nextIndex_;
  }

  InputState out{};
  out.axisX = (held_.right ? 1.0F : 0.0F) - (held_.left ? 1.0F : 0.0F);
  out.jumpHeld = held_.jump;
  out.jumpPressed = held_.jump && !prevHeld_.jump;
  out.actionHeld = held_.action;
  out.actionPressed = held_.action && !prevHeld_.action;

  prevHeld_ = held_;
  lastFrame_ = frame;
  hasLastFrame_ = true;
  return out;
}
