#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/Assets.h"
#include "core/DebugUI.h"
#include "core/Input.h"
#include "core/InputScript.h"
#include "core/SpriteCache.h"
#include "sim/FrameOutput.h"
#include "sim/Scene.h"
#include "sim/SimConfig.h"
#include "sim/Simulation.h"

struct AppConfig {
  const char* scenePath = nullptr;
  const char* simConfigPath = nullptr;
  const char* inputScriptPath = nullptr;
  std::string assetDir = ".";
  int width = 1280;
  int height = 720;
  int maxFrames = -1;
  bool headless = false;
};

// Host for the simulation: window, input, wall clock, asset loading and debug drawing.
// Headless runs skip the window and advance by a fixed 1/60 s per frame.
class App {
 public:
  struct PlayerSnapshot {
    bool valid = false;
    float x = 0.0F;
    float y = 0.0F;
    float vx = 0.0F;
    float vy = 0.0F;
    bool grounded = false;
  };

  struct Stats {
    std::uint64_t frames = 0;
    std::uint64_t ticks = 0;
    std::uint64_t audioEvents = 0;
    std::uint64_t overlapEvents = 0;
    double droppedSeconds = 0.0;
  };

  static constexpr double kHeadlessFrameSeconds = 1.0 / 60.0;
  static constexpr double kMaxFrameSeconds = 0.25;

  App() = default;
  App(const App&) = delete;
  App& operator=(const App&) = delete;

  bool init(const AppConfig& cfg);
  void run();
  void shutdown();

  [[nodiscard]] bool playerSnapshot(PlayerSnapshot& out) const;
  [[nodiscard]] const Stats& stats() const { return stats_; }

 private:
  bool reloadScene();
  void handleCommands(const AppCommands& cmds);
  void consumeOutput(const FrameOutput& out);
  void render(const FrameOutput& out);
  void renderDebugBodies(float camX, float camY);
  void drawDebugUi(const FrameOutput& out);
  [[nodiscard]] double frameSeconds(std::uint64_t& lastNs);

  AppConfig cfg_{};
  SimConfig simConfig_{};
  std::string scenePath_;
  std::string sceneId_;

  SDL_Window* window_ = nullptr;
  SDL_Renderer* renderer_ = nullptr;
  bool sdlStarted_ = false;
  bool running_ = true;
  bool debugCollision_ = true;
  bool showDebugUi_ = true;
  bool simPaused_ = false;
  int stepTicks_ = 0;
  float timeScale_ = 1.0F;

  Input input_;
  DebugUI debugUi_;
  std::vector<std::string> legend_;
  InputScript inputScript_;
  SpriteCache sprites_;
  std::unique_ptr<AssetResolver> assets_;
  std::unique_ptr<Simulation> sim_;

  Stats stats_{};
};
