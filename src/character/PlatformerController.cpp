#include "character/PlatformerController.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/Diagnostics.h"
#include "core/Time.h"
#include "ecs/Pool.h"
#include "ecs/World.h"

namespace {

constexpr float kAxisDeadzone = 0.01F;

void emitCue(World& w, EntityId e, AudioCue cue, AssetHandle sound) {
  w.registry.emplace_or_replace<AudioTrigger>(e, AudioTrigger{cue, sound});
}

}  // namespace

int PlatformerController::addConfig(PlatformerConfig cfg, int shootPool, Sounds sounds) {
  entries_.push_back(Entry{std::move(cfg), shootPool, sounds});
  return static_cast<int>(entries_.size()) - 1;
}

const PlatformerConfig* PlatformerController::config(int index) const {
  if (index < 0 || static_cast<std::size_t>(index) >= entries_.size()) {
    return nullptr;
  }
  return &entries_[static_cast<std::size_t>(index)].cfg;
}

void PlatformerController::clear() {
  entries_.clear();
  shots_.clear();
}

const PlatformerController::Entry& PlatformerController::entryFor(int index) const {
  static const Entry kDefaults{};
  if (index < 0 || static_cast<std::size_t>(index) >= entries_.size()) {
    return kDefaults;
  }
  return entries_[static_cast<std::size_t>(index)];
}

void PlatformerController::attach(World& w, EntityId e, int configIndex) const {
  PlatformerState st{};
  st.configIndex = configIndex;
  w.registry.emplace_or_replace<PlatformerState>(e, st);
  w.registry.emplace_or_replace<InputState>(e);
  w.registry.emplace_or_replace<Behavior>(e, Behavior{BehaviorKind::Platformer});
}

void PlatformerController::update(World& w, EntityId e, const TimeStep& ts, Diagnostics& diag) {
  auto& reg = w.registry;
  auto* body = reg.try_get<PhysicsBody>(e);
  auto* t = reg.try_get<Transform>(e);
  if (body == nullptr || t == nullptr) {
    diag.report(e, DiagnosticKind::MissingBody);
    return;
  }

  auto& st = reg.get_or_emplace<PlatformerState>(e);
  const Entry& entry = entryFor(st.configIndex);
  const PlatformerConfig& cfg = entry.cfg;
  InputState in{};
  if (const auto* src = reg.try_get<InputState>(e)) {
    in = *src;
  }
  const float dt = ts.dt;

  // Grounded comes from this tick's collision pass.
  if (body->grounded) {
    if (st.mode == PlatformerMode::Airborne) {
      st.mode = PlatformerMode::Grounded;
      emitCue(w, e, AudioCue::Land, entry.sounds.land);
    }
    st.coyoteTimer = cfg.jump.coyoteTime;
  } else {
    st.mode = PlatformerMode::Airborne;
    st.coyoteTimer = std::max(0.0F, st.coyoteTimer - dt);
  }

  if (in.jumpPressed) {
    st.jumpBufferTimer = cfg.jump.jumpBufferTime;
  } else {
    st.jumpBufferTimer = std::max(0.0F, st.jumpBufferTimer - dt);
  }
  st.shootCooldown = std::max(0.0F, st.shootCooldown - dt);

  // Horizontal
  const float axis = std::clamp(in.axisX, -1.0F, 1.0F);
  if (std::fabs(axis) > kAxisDeadzone) {
    st.targetVx = axis * cfg.move.maxSpeed;
    body->velocity.x = st.targetVx;
    st.facingX = (axis < 0.0F) ? -1 : 1;
  } else {
    st.targetVx = 0.0F;
    body->velocity.x *= (1.0F - cfg.move.friction);
    if (std::fabs(body->velocity.x) < cfg.move.stopSpeed) {
      body->velocity.x = 0.0F;
    }
  }

  // Jump: a press (or a buffered one) while grounded or within coyote time.
  const bool canJump = body->grounded || (st.coyoteTimer > 0.0F);
  const bool jumpRequested = in.jumpPressed || (st.jumpBufferTimer > 0.0F);
  if (jumpRequested && canJump) {
    body->velocity.y = -cfg.jump.impulse;
    body->grounded = false;
    st.mode = PlatformerMode::Airborne;
    st.coyoteTimer = 0.0F;
    st.jumpBufferTimer = 0.0F;
    emitCue(w, e, AudioCue::Jump, entry.sounds.jump);
  }

  if (cfg.shoot.enabled && in.actionPressed && st.shootCooldown <= 0.0F) {
    if (entry.shootPool < 0) {
      diag.report(e, DiagnosticKind::UnknownPool, cfg.shoot.pool);
      return;
    }
    const Rect box = World::worldAabb(*t, *body);
    const float facing = static_cast<float>(st.facingX);
    ShotRequest shot{};
    shot.shooter = e;
    shot.pool = entry.shootPool;
    shot.pos = Vec2{box.x + box.w * 0.5F + cfg.shoot.offsetX * facing,
                    box.y + box.h * 0.5F + cfg.shoot.offsetY};
    shot.velocity = Vec2{cfg.shoot.speed * facing, 0.0F};
    shot.sound = entry.sounds.shoot;
    shots_.push_back(shot);
    st.shootCooldown = cfg.shoot.cooldown;
  }
}

void PlatformerController::flushShots(World& w, ObjectPools& pools, Diagnostics& diag) {
  for (const ShotRequest& shot : shots_) {
    if (!w.valid(shot.shooter)) {
      continue;
    }
    if (!pools.spawn(shot.pool, shot.pos, shot.velocity)) {
      diag.report(shot.shooter, DiagnosticKind::PoolExhausted, pools.name(shot.pool));
      continue;
    }
    emitCue(w, shot.shooter, AudioCue::Shoot, shot.sound);
  }
  shots_.clear();
}
