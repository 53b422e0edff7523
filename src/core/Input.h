#pragma once

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_scancode.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "ecs/Components.h"

struct AppCommands {
  bool quit = false;
  bool reloadScene = false;
  bool toggleDebugCollision = false;
  bool toggleDebugUi = false;
};

// Keyboard and gamepad state turned into the simulation's logical input snapshot.
class Input {
 public:
  void init();
  void shutdown();

  void handleEvent(const SDL_Event& e);

  [[nodiscard]] bool hasGamepad() const { return gamepad_ != nullptr; }
  [[nodiscard]] const char* gamepadName() const;
  void setGamepadDeadzone(int deadzone);
  void appendLegend(std::vector<std::string>& out) const;

  // Snapshot for this frame; press edges are cleared, held state is kept.
  InputState consume();
  AppCommands consumeCommands();

 private:
  void updateDerivedActions();
  void clearGamepadState();
  void tryOpenFirstGamepad();

  std::array<bool, SDL_SCANCODE_COUNT> scancodeDown_{};
  InputState state_{};
  AppCommands commands_{};

  SDL_Gamepad* gamepad_ = nullptr;
  std::uint32_t gamepadId_ = 0;
  int axisLeftX_ = 0;
  int axisDeadzone_ = 8000;
  bool dpadLeft_ = false;
  bool dpadRight_ = false;
  bool btnSouth_ = false;  // jump
  bool btnWest_ = false;   // action

  bool rHeld_ = false;
  bool f1Held_ = false;
  bool f2Held_ = false;
};
