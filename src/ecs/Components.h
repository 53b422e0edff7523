#pragma once

#include <cstdint>
#include <string>

#include "core/Assets.h"
#include "ecs/Entity.h"

struct Vec2 {
  float x = 0.0F;
  float y = 0.0F;
  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
  bool operator==(const Vec2& o) const = default;
};

struct Rect {
  float x = 0.0F;
  float y = 0.0F;
  float w = 0.0F;
  float h = 0.0F;

  [[nodiscard]] float right() const { return x + w; }
  [[nodiscard]] float bottom() const { return y + h; }
};

struct Transform {
  Vec2 pos{};
  float rotation = 0.0F;  // radians
  Vec2 scale{1.0F, 1.0F};
};

enum class BodyKind : std::uint8_t {
  Static,   // immovable collider, never integrated
  Dynamic,  // integrated every step, resolved against others
  Trigger,  // overlap events only
};

// Bitmask collision layers (combine via bitwise OR)
enum CollisionLayer : std::uint32_t {
  kLayerDefault = 1U << 0U,
  kLayerPlayer = 1U << 1U,
  kLayerEnemy = 1U << 2U,
  kLayerWorld = 1U << 3U,
  kLayerProjectile = 1U << 4U,
  kLayerTrigger = 1U << 5U,
  kLayerAll = 0xFFFFFFFFU,
};

struct PhysicsBody {
  Vec2 velocity{};  // units/s
  Vec2 force{};     // accumulated for the next step, cleared by the integrator
  Vec2 offset{};    // AABB top-left relative to Transform::pos
  Vec2 size{};      // AABB extent before scale
  BodyKind kind = BodyKind::Dynamic;
  std::uint32_t layer = kLayerDefault;
  std::uint32_t mask = kLayerAll;
  float mass = 1.0F;
  float gravityScale = 1.0F;
  bool noSelfCollision = false;
  bool despawnOnContact = false;
  bool grounded = false;
};

// Closed set of per-entity behaviors, dispatched by Systems::behaviors.
enum class BehaviorKind : std::uint8_t {
  None,
  Platformer,
  Projectile,
};

struct Behavior {
  BehaviorKind kind = BehaviorKind::None;
};

enum class PlatformerMode : std::uint8_t { Airborne, Grounded };

struct PlatformerState {
  PlatformerMode mode = PlatformerMode::Airborne;
  float coyoteTimer = 0.0F;      // seconds of grace left after leaving ground
  float jumpBufferTimer = 0.0F;  // seconds left on a buffered jump press
  float shootCooldown = 0.0F;
  float targetVx = 0.0F;
  int facingX = 1;
  int configIndex = -1;  // into PlatformerController's config table
};

struct Lifetime {
  float remaining = 0.0F;  // seconds; <= 0 means unlimited
};

// Logical input, already debounced by the platform layer.
struct InputState {
  float axisX = 0.0F;  // -1..1
  bool jumpHeld = false;
  bool jumpPressed = false;
  bool actionHeld = false;
  bool actionPressed = false;
};

struct Visual {
  AssetHandle handle{};
  bool failureReported = false;
};

enum class AudioCue : std::uint8_t { None, Jump, Land, Shoot };

struct AudioTrigger {
  AudioCue cue = AudioCue::None;
  AssetHandle sound{};
};

struct PoolSlot {
  std::uint16_t pool = 0;
  std::uint32_t slot = 0;
};

// Pooled entity that is not currently handed out. Every system excludes it.
struct Dormant {};

struct DebugName {
  std::string name;
};
