#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

#include "ecs/Components.h"

// Scripted input for headless runs: keyframes set held buttons from a given frame onward,
// and press edges are derived from held-state changes between samples.
class InputScript {
 public:
  bool loadFromToml(const char* path);
  void reset();
  InputState sample(std::uint64_t frame);

  [[nodiscard]] bool loaded() const { return loaded_; }
  [[nodiscard]] std::size_t keyframeCount() const { return keyframes_.size(); }
  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  struct Held {
    bool left = false;
    bool right = false;
    bool jump = false;
    bool action = false;
  };

  enum MaskBits : std::uint32_t {
    kLeft = 1U << 0U,
    kRight = 1U << 1U,
    kJump = 1U << 2U,
    kAction = 1U << 3U,
  };

  struct Keyframe {
    std::uint64_t frame = 0;
    std::uint32_t mask = 0;
    Held values{};
  };

  bool appendFromToml(const std::filesystem::path& path, std::unordered_set<std::string>& seen);

  std::vector<Keyframe> keyframes_;
  Held held_{};
  Held prevHeld_{};
  std::size_t nextIndex_ = 0;
  std::uint64_t lastFrame_ = 0;
  bool hasLastFrame_ = false;
  bool loaded_ = false;
  std::string path_;
};
