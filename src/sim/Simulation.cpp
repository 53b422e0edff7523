#include "sim/Simulation.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/Assets.h"
#include "core/Log.h"
#include "core/Time.h"
#include "ecs/Systems.h"

Simulation::Simulation(SimConfig cfg, AssetResolver& assets)
    : cfg_(std::move(cfg)), assets_(&assets), index_(cfg_.broadphase.cellSize) {}

bool Simulation::refuseDuringTick(const char* what) const {
  if (!inTick_) {
    return false;
  }
  Log::warnf("sim", "{} refused: a tick is in progress", what);
  return true;
}

bool Simulation::loadScene(const SceneDesc& scene) {
  if (refuseDuringTick("loadScene")) {
    return false;
  }
  if (loaded_) {
    unloadScene();
  }

  for (const PoolDesc& pd : scene.pools) {
    PoolTemplate tmpl{};
    tmpl.body = pd.body;
    tmpl.behavior = BehaviorKind::Projectile;
    tmpl.lifetime = pd.lifetime;
    tmpl.visual = assets_->request(pd.sprite);
    pools_.add(pd.name, pd.capacity, tmpl);
  }

  std::size_t spawned = 0;
  for (const EntityDesc& desc : scene.entities) {
    if (spawn(desc)) {
      ++spawned;
    }
  }

  loaded_ = true;
  Log::infof("sim", "scene '{}' loaded: {} entities, {} pools", scene.id, spawned, pools_.size());
  return true;
}

bool Simulation::unloadScene() {
  if (refuseDuringTick("unloadScene")) {
    return false;
  }
  pools_.clear();
  platformer_.clear();
  world_.clear();
  index_.clear();
  diag_.reset();
  released_.clear();
  accumulator_ = 0.0;
  loaded_ = false;
  return true;
}

std::optional<EntityId> Simulation::spawn(const EntityDesc& desc) {
  if (refuseDuringTick("spawn")) {
    return std::nullopt;
  }

  auto& reg = world_.registry;
  const EntityId e = world_.create();
  reg.emplace<Transform>(e, desc.transform);
  if (desc.hasBody) {
    reg.emplace<PhysicsBody>(e, desc.body);
  }
  reg.emplace<Behavior>(e, Behavior{desc.behavior});
  reg.emplace<Lifetime>(e, Lifetime{desc.lifetime});
  if (!desc.name.empty()) {
    reg.emplace<DebugName>(e, desc.name);
  }
  if (!desc.sprite.empty()) {
    reg.emplace<Visual>(e, Visual{assets_->request(desc.sprite)});
  }

  if (desc.behavior == BehaviorKind::Platformer) {
    const PlatformerConfig& cfg = desc.platformer;
    int shootPool = -1;
    if (cfg.shoot.enabled) {
      shootPool = pools_.indexOf(cfg.shoot.pool);
      if (shootPool < 0) {
        Log::warnf("sim", "'{}' shoots from unknown pool '{}'", desc.name, cfg.shoot.pool);
      }
    }
    PlatformerController::Sounds sounds{};
    sounds.jump = assets_->request(cfg.audio.jump);
    sounds.land = assets_->request(cfg.audio.land);
    sounds.shoot = assets_->request(cfg.audio.shoot);
    const int configIndex = platformer_.addConfig(cfg, shootPool, sounds);
    platformer_.attach(world_, e, configIndex);

    if (world_.player == kInvalidEntity) {
      world_.player = e;
    }
  }
  if (desc.player) {
    world_.player = e;
  }
  return e;
}

std::optional<EntityId> Simulation::spawnPooled(std::string_view pool, Vec2 pos, Vec2 velocity) {
  if (refuseDuringTick("spawnPooled")) {
    return std::nullopt;
  }
  const int index = pools_.indexOf(pool);
  if (index < 0) {
    Log::warnf("sim", "spawnPooled: unknown pool '{}'", pool);
    return std::nullopt;
  }
  return pools_.spawn(index, pos, velocity);
}

bool Simulation::despawn(EntityId id) {
  if (refuseDuringTick("despawn")) {
    return false;
  }
  if (pools_.release(id)) {
    diag_.forget(id);
    return true;
  }
  if (!world_.valid(id) || world_.registry.all_of<PoolSlot>(id)) {
    return false;
  }
  world_.destroy(id);
  diag_.forget(id);
  return true;
}

void Simulation::applyInput(const InputState& input) {
  const EntityId player = world_.player;
  if (!world_.valid(player)) {
    return;
  }
  auto& in = world_.registry.get_or_emplace<InputState>(player);
  // Press edges survive until a tick consumes them, so a press during a frame that runs no
  // tick is not lost.
  const bool jumpPressed = in.jumpPressed || input.jumpPressed;
  const bool actionPressed = in.actionPressed || input.actionPressed;
  in = input;
  in.jumpPressed = jumpPressed;
  in.actionPressed = actionPressed;
}

void Simulation::consumePressEdges() {
  auto view = world_.registry.view<InputState>();
  for (auto entity : view) {
    auto& in = view.get<InputState>(entity);
    in.jumpPressed = false;
    in.actionPressed = false;
  }
}

const FrameOutput& Simulation::frame(double elapsedSeconds, const InputState& input) {
  out_.clear();
  diag_.beginFrame();

  if (!std::isfinite(elapsedSeconds) || elapsedSeconds < 0.0) {
    elapsedSeconds = 0.0;
  }
  accumulator_ += elapsedSeconds;

  applyInput(input);

  const double dt = cfg_.tickSeconds();
  int steps = 0;
  while (accumulator_ >= dt && steps < cfg_.time.maxSubSteps) {
    tick(TimeStep{cfg_.dt(), frames_, steps});
    accumulator_ -= dt;
    ++steps;
    if (steps == 1) {
      consumePressEdges();
    }
  }

  // Spiral-of-death guard: whole ticks beyond the cap are dropped, the remainder is kept.
  if (accumulator_ >= dt) {
    const double dropped = std::floor(accumulator_ / dt) * dt;
    accumulator_ -= dropped;
    out_.droppedSeconds = dropped;
  }

  out_.frame = frames_;
  out_.subSteps = steps;
  publish();
  out_.diagnostics = diag_.frame();
  ++frames_;
  return out_;
}

void Simulation::tick(const TimeStep& ts) {
  inTick_ = true;
  released_.clear();

  Systems::integrate(world_, cfg_.physics, ts, diag_);
  Systems::rebuildIndex(world_, index_, cfg_.physics.contactSkin, diag_);
  collision_.run(world_, index_, cfg_.physics, pools_, diag_);
  released_.insert(released_.end(), collision_.released().begin(), collision_.released().end());
  collectOverlaps();
  Systems::behaviors(world_, platformer_, pools_, ts, diag_, released_);

  for (const EntityId e : released_) {
    diag_.forget(e);
  }

  ++ticks_;
  inTick_ = false;
}

void Simulation::collectOverlaps() {
  for (const OverlapEvent& ev : collision_.overlaps()) {
    if (std::find(out_.overlaps.begin(), out_.overlaps.end(), ev) == out_.overlaps.end()) {
      out_.overlaps.push_back(ev);
    }
  }
}

void Simulation::publish() {
  auto& reg = world_.registry;

  auto view = reg.view<Transform>(entt::exclude<Dormant>);
  for (auto entity : view) {
    auto* visual = reg.try_get<Visual>(entity);
    const auto* audio = reg.try_get<AudioTrigger>(entity);
    if (visual == nullptr && audio == nullptr) {
      continue;
    }

    RenderItem item{};
    item.entity = entity;
    item.transform = view.get<Transform>(entity);

    if (visual != nullptr) {
      switch (assets_->status(visual->handle)) {
        case AssetStatus::Pending:
          // Retried next frame; any audio cue waits with it.
          continue;
        case AssetStatus::Failed:
          if (!visual->failureReported) {
            visual->failureReported = true;
            diag_.report(entity, DiagnosticKind::AssetFailed, assets_->refOf(visual->handle));
          }
          break;
        case AssetStatus::Ready:
          item.visual = visual->handle;
          break;
      }
    }

    if (audio != nullptr) {
      item.audio = AudioEvent{audio->cue, audio->sound};
      reg.remove<AudioTrigger>(entity);
    } else if (!item.visual.valid()) {
      continue;
    }
    out_.render.push_back(item);
  }

  std::sort(out_.render.begin(), out_.render.end(), [](const RenderItem& a, const RenderItem& b) {
    return entityLess(a.entity, b.entity);
  });
}
