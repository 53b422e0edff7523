#include "core/Input.h"

#include <SDL3/SDL_events.h>
#include <SDL3/SDL_gamepad.h>
#include <SDL3/SDL_joystick.h>
#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_scancode.h>
#include <SDL3/SDL_stdinc.h>

#include <algorithm>
#include <memory>

namespace {

constexpr SDL_Scancode kMoveLeftPrimary = SDL_SCANCODE_LEFT;
constexpr SDL_Scancode kMoveLeftAlt = SDL_SCANCODE_A;
constexpr SDL_Scancode kMoveRightPrimary = SDL_SCANCODE_RIGHT;
constexpr SDL_Scancode kMoveRightAlt = SDL_SCANCODE_D;
constexpr SDL_Scancode kJumpKey = SDL_SCANCODE_J;
constexpr SDL_Scancode kJumpAlt = SDL_SCANCODE_SPACE;
constexpr SDL_Scancode kActionKey = SDL_SCANCODE_L;

constexpr SDL_Scancode kQuitKey = SDL_SCANCODE_ESCAPE;
constexpr SDL_Scancode kReloadKey = SDL_SCANCODE_R;
constexpr SDL_Scancode kToggleDebugUiKey = SDL_SCANCODE_F1;
constexpr SDL_Scancode kToggleCollisionKey = SDL_SCANCODE_F2;

constexpr SDL_GamepadAxis kMoveAxisX = SDL_GAMEPAD_AXIS_LEFTX;
constexpr SDL_GamepadButton kDpadLeftButton = SDL_GAMEPAD_BUTTON_DPAD_LEFT;
constexpr SDL_GamepadButton kDpadRightButton = SDL_GAMEPAD_BUTTON_DPAD_RIGHT;
constexpr SDL_GamepadButton kJumpButton = SDL_GAMEPAD_BUTTON_SOUTH;
constexpr SDL_GamepadButton kActionButton = SDL_GAMEPAD_BUTTON_WEST;

const char* prettyScancode(SDL_Scancode sc) {
  switch (sc) {
    case SDL_SCANCODE_LEFT:
      return "←";
    case SDL_SCANCODE_RIGHT:
      return "→";
    default:
      break;
  }

  const char* name = SDL_GetScancodeName(sc);
  if (!name || !*name) {
    return "?";
  }
  return name;
}

}  // namespace

void Input::clearGamepadState() {
  axisLeftX_ = 0;
  dpadLeft_ = false;
  dpadRight_ = false;
  btnSouth_ = false;
  btnWest_ = false;
}

void Input::tryOpenFirstGamepad() {
  if (gamepad_) {
    return;
  }

  int count = 0;
  using GamepadListPtr = std::unique_ptr<SDL_JoystickID, decltype(&SDL_free)>;
  GamepadListPtr ids(SDL_GetGamepads(&count), SDL_free);
  if (!ids || count <= 0) {
    return;
  }

  for (int i = 0; i < count; ++i) {
    SDL_Gamepad* gp = SDL_OpenGamepad(ids.get()[i]);
    if (!gp) {
      continue;
    }
    gamepad_ = gp;
    gamepadId_ = ids.get()[i];
    break;
  }
}

void Input::init() {
  SDL_SetGamepadEventsEnabled(true);
  tryOpenFirstGamepad();
}

void Input::shutdown() {
  if (gamepad_) {
    SDL_CloseGamepad(gamepad_);
    gamepad_ = nullptr;
  }
  gamepadId_ = 0;
  clearGamepadState();
}

void Input::handleEvent(const SDL_Event& e) {
  switch (e.type) {
    case SDL_EVENT_QUIT:
      commands_.quit = true;
      return;
    case SDL_EVENT_GAMEPAD_ADDED:
      if (!gamepad_) {
        if (SDL_Gamepad* gp = SDL_OpenGamepad(e.gdevice.which)) {
          gamepad_ = gp;
          gamepadId_ = e.gdevice.which;
        }
      }
      return;
    case SDL_EVENT_GAMEPAD_REMOVED:
      if (gamepad_ && e.gdevice.which == gamepadId_) {
        SDL_CloseGamepad(gamepad_);
        gamepad_ = nullptr;
        gamepadId_ = 0;
        clearGamepadState();
        tryOpenFirstGamepad();
        updateDerivedActions();
      }
      return;
    case SDL_EVENT_GAMEPAD_AXIS_MOTION:
      if (gamepad_ && e.gaxis.which == gamepadId_ && e.gaxis.axis == kMoveAxisX) {
        axisLeftX_ = static_cast<int>(e.gaxis.value);
        updateDerivedActions();
      }
      return;
    case SDL_EVENT_GAMEPAD_BUTTON_DOWN:
    case SDL_EVENT_GAMEPAD_BUTTON_UP:
      if (gamepad_ && e.gbutton.which == gamepadId_) {
        const bool down = e.gbutton.down;
        switch (e.gbutton.button) {
          case kDpadLeftButton:
            dpadLeft_ = down;
            break;
          case kDpadRightButton:
            dpadRight_ = down;
            break;
          case kJumpButton:
            btnSouth_ = down;
            break;
          case kActionButton:
            btnWest_ = down;
            break;
          default:
            break;
        }
        updateDerivedActions();
      }
      return;
    case SDL_EVENT_KEY_DOWN:
    case SDL_EVENT_KEY_UP: {
      const int sc = static_cast<int>(e.key.scancode);
      if (sc < 0 || sc >= static_cast<int>(scancodeDown_.size())) {
        return;
      }
      scancodeDown_[sc] = e.key.down;
      updateDerivedActions();
      return;
    }
    default:
      return;
  }
}

void Input::setGamepadDeadzone(int deadzone) {
  axisDeadzone_ = std::clamp(deadzone, 0, 32767);
  updateDerivedActions();
}

const char* Input::gamepadName() const {
  if (!gamepad_) {
    return nullptr;
  }
  const char* name = SDL_GetGamepadName(gamepad_);
  if (!name || !*name) {
    return nullptr;
  }
  return name;
}

void Input::appendLegend(std::vector<std::string>& out) const {
  out.push_back(std::string("Move: ") + prettyScancode(kMoveLeftPrimary) + "/" +
                prettyScancode(kMoveRightPrimary) + " or " + prettyScancode(kMoveLeftAlt) + "/" +
                prettyScancode(kMoveRightAlt) + "  (pad: D-pad / left stick)");
  out.push_back(std::string("Jump: ") + prettyScancode(kJumpKey) + "/" +
                prettyScancode(kJumpAlt) + "  (pad: South)");
  out.push_back(std::string("Shoot: ") + prettyScancode(kActionKey) + "  (pad: West)");
  if (const char* gpName = gamepadName()) {
    out.push_back(std::string("Gamepad: ") + gpName);
  }
  out.push_back(std::string("Reload: ") + prettyScancode(kReloadKey) + "  Debug UI: " +
                prettyScancode(kToggleDebugUiKey) + "  Collision: " +
                prettyScancode(kToggleCollisionKey) + "  Quit: " + prettyScancode(kQuitKey));
}

InputState Input::consume() {
  InputState out = state_;
  state_.jumpPressed = false;
  state_.actionPressed = false;
  return out;
}

AppCommands Input::consumeCommands() {
  AppCommands out = commands_;
  commands_ = AppCommands{};
  return out;
}

void Input::updateDerivedActions() {
  const bool leftKey = scancodeDown_[kMoveLeftPrimary] || scancodeDown_[kMoveLeftAlt];
  const bool rightKey = scancodeDown_[kMoveRightPrimary] || scancodeDown_[kMoveRightAlt];

  float axis = (rightKey ? 1.0F : 0.0F) - (leftKey ? 1.0F : 0.0F);
  if (dpadLeft_ != dpadRight_) {
    axis = dpadRight_ ? 1.0F : -1.0F;
  } else if (axisLeftX_ < -axisDeadzone_ || axisLeftX_ > axisDeadzone_) {
    axis = std::clamp(static_cast<float>(axisLeftX_) / 32767.0F, -1.0F, 1.0F);
  }
  state_.axisX = axis;

  const bool jumpNow = scancodeDown_[kJumpKey] || scancodeDown_[kJumpAlt] || btnSouth_;
  if (jumpNow && !state_.jumpHeld) {
    state_.jumpPressed = true;
  }
  state_.jumpHeld = jumpNow;

  const bool actionNow = scancodeDown_[kActionKey] || btnWest_;
  if (actionNow && !state_.actionHeld) {
    state_.actionPressed = true;
  }
  state_.actionHeld = actionNow;

  if (scancodeDown_[kQuitKey]) {
    commands_.quit = true;
  }

  const bool rNow = scancodeDown_[kReloadKey];
  if (rNow && !rHeld_) {
    commands_.reloadScene = true;
  }
  rHeld_ = rNow;

  const bool f1Now = scancodeDown_[kToggleDebugUiKey];
  if (f1Now && !f1Held_) {
    commands_.toggleDebugUi = true;
  }
  f1Held_ = f1Now;

  const bool f2Now = scancodeDown_[kToggleCollisionKey];
  if (f2Now && !f2Held_) {
    commands_.toggleDebugCollision = true;
  }
  f2Held_ = f2Now;
}
