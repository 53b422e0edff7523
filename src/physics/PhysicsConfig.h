#pragma once

struct PhysicsConfig {
  static constexpr float kDefaultGravity = 1800.0F;   // units/s^2, +y is down
  static constexpr float kDefaultMaxSpeed = 4000.0F;  // units/s, per axis
  static constexpr float kDefaultContactSkin = 0.01F;
  static constexpr float kDefaultRestitution = 0.0F;

  float gravity = kDefaultGravity;
  float maxSpeed = kDefaultMaxSpeed;
  float contactSkin = kDefaultContactSkin;
  float restitution = kDefaultRestitution;
};
