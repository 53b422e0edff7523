#pragma once

#include <string>

// Tuning for one platformer-controlled character, loaded from a character TOML file.
struct PlatformerConfig {
  int version = 0;
  std::string id;
  std::string displayName;

  struct Move {
    float maxSpeed = 240.0F;  // units/s at full input
    float friction = 0.25F;   // fraction of v.x removed per tick without input
    float stopSpeed = 2.0F;   // |v.x| below this snaps to zero
  } move;

  struct Jump {
    float impulse = 620.0F;  // units/s, applied upward
    float coyoteTime = 0.1F;
    float jumpBufferTime = 0.12F;
  } jump;

  struct Shoot {
    bool enabled = false;
    std::string pool;  // scene pool name
    float speed = 480.0F;
    float offsetX = 0.0F;  // from body center, mirrored by facing
    float offsetY = 0.0F;
    float cooldown = 0.25F;
  } shoot;

  // Asset references resolved by the simulation when the character is attached.
  struct Audio {
    std::string jump;
    std::string land;
    std::string shoot;
  } audio;

  bool loadFromToml(const char* path);
};
