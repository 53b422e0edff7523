#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_video.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Dear ImGui overlay for the windowed host. Headless runs never initialize it.

struct DebugUIOverlayModel {
  std::uint64_t frame = 0;
  std::uint64_t ticks = 0;
  int subSteps = 0;
  double accumulator = 0.0;
  double droppedSeconds = 0.0;
  float dt = 0.0F;
  std::size_t entities = 0;
  std::size_t indexedBodies = 0;
  std::size_t contacts = 0;
  std::size_t overlaps = 0;
  std::size_t pendingAssets = 0;
  bool debugCollision = false;

  bool hasPlayer = false;
  std::uint32_t playerId = 0;
  std::string playerName;
  float posX = 0.0F;
  float posY = 0.0F;
  float velX = 0.0F;
  float velY = 0.0F;
  bool grounded = false;
  bool hasController = false;
  float coyoteTimer = 0.0F;
  float jumpBufferTimer = 0.0F;
  float shootCooldown = 0.0F;
};

struct DebugUIPoolRow {
  std::string name;
  std::size_t active = 0;
  std::size_t capacity = 0;
};

struct DebugUIInspectorModel {
  std::string scenePath;
  std::string sceneId;
  std::vector<DebugUIPoolRow> pools;
  std::vector<std::string> diagnostics;  // this frame, preformatted
  std::vector<std::string> legend;

  bool simPaused = false;
  float timeScale = 1.0F;
};

struct DebugUIActions {
  bool reloadScene = false;
  bool setDebugCollision = false;
  bool debugCollision = false;
  bool setSimPaused = false;
  bool simPaused = false;
  int stepTicks = 0;
  bool setTimeScale = false;
  float timeScale = 1.0F;
};

class DebugUI {
 public:
  bool init(SDL_Window* window, SDL_Renderer* renderer);
  void shutdown();

  void processEvent(const SDL_Event& e);
  void beginFrame();
  void endFrame(SDL_Renderer* renderer);

  bool initialized() const { return initialized_; }
  bool wantCaptureKeyboard() const;

  void drawOverlay(const DebugUIOverlayModel& model);
  DebugUIActions drawInspector(const DebugUIInspectorModel& model, bool debugCollision);

 private:
  bool initialized_ = false;
  std::string iniPath_;
};
