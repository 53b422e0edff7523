#include "core/App.h"

#include <SDL3/SDL.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>
#include <string>
#include <vector>

#include "core/Log.h"
#include "ecs/World.h"

bool App::init(const AppConfig& cfg) {
  cfg_ = cfg;

  if (cfg_.simConfigPath && !simConfig_.loadFromToml(cfg_.simConfigPath)) {
    Log::errorf("app", "failed to load sim config: {}", cfg_.simConfigPath);
    return false;
  }

  assets_ = std::make_unique<AssetResolver>(simConfig_.assets.capacity);
  sim_ = std::make_unique<Simulation>(simConfig_, *assets_);

  if (cfg_.inputScriptPath) {
    if (!inputScript_.loadFromToml(cfg_.inputScriptPath)) {
      Log::errorf("app", "failed to load input script: {}", cfg_.inputScriptPath);
      return false;
    }
  }

  if (!cfg_.headless) {
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMEPAD)) {
      Log::errorf("app", "SDL_Init failed: {}", SDL_GetError());
      return false;
    }
    sdlStarted_ = true;

    window_ = SDL_CreateWindow("platcore", cfg_.width, cfg_.height, SDL_WINDOW_RESIZABLE);
    if (!window_) {
      Log::errorf("app", "SDL_CreateWindow failed: {}", SDL_GetError());
      return false;
    }

    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (!renderer_) {
      Log::errorf("app", "SDL_CreateRenderer failed: {}", SDL_GetError());
      return false;
    }
    SDL_SetRenderVSync(renderer_, 1);
    input_.init();
    if (!debugUi_.init(window_, renderer_)) {
      Log::warnf("app", "debug UI unavailable; continuing without it");
    }
  }

  sprites_.init(renderer_, cfg_.assetDir);

  scenePath_ = cfg_.scenePath ? cfg_.scenePath : "";
  if (!reloadScene()) {
    return false;
  }

  if (!cfg_.headless) {
    input_.appendLegend(legend_);
    for (const std::string& line : legend_) {
      Log::infof("app", "{}", line);
    }
  }
  return true;
}

bool App::reloadScene() {
  if (scenePath_.empty()) {
    Log::errorf("app", "no scene given");
    return false;
  }
  SceneDesc scene;
  if (!scene.loadFromToml(scenePath_.c_str())) {
    Log::errorf("app", "failed to load scene: {}", scenePath_);
    return false;
  }
  if (!sim_->loadScene(scene)) {
    return false;
  }
  sceneId_ = scene.id;
  return true;
}

void App::run() {
  std::uint64_t lastNs = cfg_.headless ? 0 : SDL_GetTicksNS();

  while (running_) {
    if (!cfg_.headless) {
      SDL_Event e;
      while (SDL_PollEvent(&e)) {
        debugUi_.processEvent(e);
        const bool isKey = e.type == SDL_EVENT_KEY_DOWN || e.type == SDL_EVENT_KEY_UP;
        if (isKey && debugUi_.wantCaptureKeyboard()) {
          continue;
        }
        input_.handleEvent(e);
      }
      handleCommands(input_.consumeCommands());
    }

    const double elapsed = frameSeconds(lastNs);

    InputState in{};
    if (inputScript_.loaded()) {
      in = inputScript_.sample(stats_.frames);
    } else if (!cfg_.headless) {
      in = input_.consume();
    }

    sprites_.fulfil(*assets_);
    const FrameOutput& out = sim_->frame(elapsed, in);
    consumeOutput(out);
    render(out);

    ++stats_.frames;
    if (cfg_.maxFrames > 0 && stats_.frames >= static_cast<std::uint64_t>(cfg_.maxFrames)) {
      running_ = false;
    }
  }
}

void App::shutdown() {
  if (sim_) {
    sim_->unloadScene();
  }
  debugUi_.shutdown();
  sprites_.shutdown();
  input_.shutdown();

  if (renderer_) {
    SDL_DestroyRenderer(renderer_);
    renderer_ = nullptr;
  }
  if (window_) {
    SDL_DestroyWindow(window_);
    window_ = nullptr;
  }
  if (sdlStarted_) {
    SDL_Quit();
    sdlStarted_ = false;
  }
}

void App::handleCommands(const AppCommands& cmds) {
  if (cmds.quit) {
    running_ = false;
  }
  if (cmds.toggleDebugCollision) {
    debugCollision_ = !debugCollision_;
  }
  if (cmds.toggleDebugUi) {
    showDebugUi_ = !showDebugUi_;
  }
  if (cmds.reloadScene && !reloadScene()) {
    Log::warnf("app", "scene reload failed; keeping the current scene");
  }
}

double App::frameSeconds(std::uint64_t& lastNs) {
  if (cfg_.headless) {
    return kHeadlessFrameSeconds;
  }
  const std::uint64_t now = SDL_GetTicksNS();
  const double wall = std::min(static_cast<double>(now - lastNs) / 1e9, kMaxFrameSeconds);
  lastNs = now;

  if (simPaused_) {
    const double stepped = static_cast<double>(stepTicks_) * simConfig_.tickSeconds();
    stepTicks_ = 0;
    return stepped;
  }
  return wall * static_cast<double>(timeScale_);
}

void App::consumeOutput(const FrameOutput& out) {
  stats_.ticks += static_cast<std::uint64_t>(out.subSteps);
  stats_.overlapEvents += out.overlaps.size();
  stats_.droppedSeconds += out.droppedSeconds;
  for (const RenderItem& item : out.render) {
    if (item.audio) {
      ++stats_.audioEvents;
    }
  }
  if (out.droppedSeconds > 0.0) {
    Log::warnf("app", "frame {}: dropped {:.3f}s of simulation", out.frame, out.droppedSeconds);
  }
}

void App::render(const FrameOutput& out) {
  if (!renderer_) {
    return;
  }

  int viewW = cfg_.width;
  int viewH = cfg_.height;
  SDL_GetCurrentRenderOutputSize(renderer_, &viewW, &viewH);

  float camX = 0.0F;
  float camY = 0.0F;
  PlayerSnapshot player{};
  if (playerSnapshot(player)) {
    camX = std::floor(player.x - static_cast<float>(viewW) * 0.5F);
    camY = std::floor(player.y - static_cast<float>(viewH) * 0.5F);
  }

  SDL_SetRenderDrawColor(renderer_, 20, 20, 24, 255);
  SDL_RenderClear(renderer_);

  for (const RenderItem& item : out.render) {
    SDL_Texture* tex = sprites_.texture(item.visual);
    if (!tex) {
      continue;
    }
    float w = 0.0F;
    float h = 0.0F;
    if (!SDL_GetTextureSize(tex, &w, &h)) {
      continue;
    }
    const SDL_FRect dst{item.transform.pos.x - camX, item.transform.pos.y - camY,
                        w * std::fabs(item.transform.scale.x),
                        h * std::fabs(item.transform.scale.y)};
    const SDL_FlipMode flip =
        (item.transform.scale.x < 0.0F) ? SDL_FLIP_HORIZONTAL : SDL_FLIP_NONE;
    SDL_RenderTextureRotated(renderer_, tex, nullptr, &dst,
                             static_cast<double>(item.transform.rotation) * 180.0 / std::numbers::pi,
                             nullptr, flip);
  }

  if (debugCollision_) {
    renderDebugBodies(camX, camY);
  }

  if (showDebugUi_ && debugUi_.initialized()) {
    debugUi_.beginFrame();
    drawDebugUi(out);
    debugUi_.endFrame(renderer_);
  }

  SDL_RenderPresent(renderer_);
}

void App::renderDebugBodies(float camX, float camY) {
  const World& w = sim_->world();
  auto view = w.registry.view<Transform, PhysicsBody>(entt::exclude<Dormant>);
  for (auto entity : view) {
    const auto& t = view.get<Transform>(entity);
    const auto& b = view.get<PhysicsBody>(entity);
    const Rect box = World::worldAabb(t, b);
    const SDL_FRect r{box.x - camX, box.y - camY, box.w, box.h};

    switch (b.kind) {
      case BodyKind::Static:
        SDL_SetRenderDrawColor(renderer_, 90, 90, 110, 255);
        SDL_RenderFillRect(renderer_, &r);
        break;
      case BodyKind::Dynamic:
        if (b.grounded) {
          SDL_SetRenderDrawColor(renderer_, 120, 220, 120, 255);
        } else {
          SDL_SetRenderDrawColor(renderer_, 90, 180, 240, 255);
        }
        SDL_RenderRect(renderer_, &r);
        break;
      case BodyKind::Trigger:
        SDL_SetRenderDrawColor(renderer_, 240, 200, 60, 255);
        SDL_RenderRect(renderer_, &r);
        break;
    }
  }
}

void App::drawDebugUi(const FrameOutput& out) {
  const World& w = sim_->world();

  DebugUIOverlayModel overlay{};
  overlay.frame = out.frame;
  overlay.ticks = sim_->tickCount();
  overlay.subSteps = out.subSteps;
  overlay.accumulator = sim_->accumulator();
  overlay.droppedSeconds = stats_.droppedSeconds;
  overlay.dt = simConfig_.dt();
  overlay.entities = w.registry.view<Transform>(entt::exclude<Dormant>).size_hint();
  overlay.indexedBodies = sim_->index().bodyCount();
  overlay.contacts = sim_->collision().contacts().size();
  overlay.overlaps = out.overlaps.size();
  overlay.pendingAssets = assets_->pending().size();
  overlay.debugCollision = debugCollision_;

  PlayerSnapshot player{};
  if (playerSnapshot(player)) {
    overlay.hasPlayer = true;
    overlay.playerId = entityKey(w.player);
    if (const auto* name = w.registry.try_get<DebugName>(w.player)) {
      overlay.playerName = name->name;
    }
    overlay.posX = player.x;
    overlay.posY = player.y;
    overlay.velX = player.vx;
    overlay.velY = player.vy;
    overlay.grounded = player.grounded;
    if (const auto* st = w.registry.try_get<PlatformerState>(w.player)) {
      overlay.hasController = true;
      overlay.coyoteTimer = st->coyoteTimer;
      overlay.jumpBufferTimer = st->jumpBufferTimer;
      overlay.shootCooldown = st->shootCooldown;
    }
  }
  debugUi_.drawOverlay(overlay);

  DebugUIInspectorModel inspector{};
  inspector.scenePath = scenePath_;
  inspector.sceneId = sceneId_;
  inspector.simPaused = simPaused_;
  inspector.timeScale = timeScale_;
  inspector.legend = legend_;
  ObjectPools& pools = sim_->pools();
  for (std::size_t i = 0; i < pools.size(); ++i) {
    const int idx = static_cast<int>(i);
    const ObjectPool* pool = pools.get(idx);
    inspector.pools.push_back(DebugUIPoolRow{pools.name(idx), pool->activeCount(), pool->capacity()});
  }
  for (const Diagnostic& d : out.diagnostics) {
    inspector.diagnostics.push_back(std::format("entity {}: {}", entityKey(d.entity),
                                                diagnosticName(d.kind)));
  }

  const DebugUIActions actions = debugUi_.drawInspector(inspector, debugCollision_);
  if (actions.setDebugCollision) {
    debugCollision_ = actions.debugCollision;
  }
  if (actions.setSimPaused) {
    simPaused_ = actions.simPaused;
  }
  if (actions.stepTicks > 0) {
    stepTicks_ += actions.stepTicks;
  }
  if (actions.setTimeScale) {
    timeScale_ = actions.timeScale;
  }
  if (actions.reloadScene && !reloadScene()) {
    Log::warnf("app", "scene reload failed; keeping the current scene");
  }
}

bool App::playerSnapshot(PlayerSnapshot& out) const {
  out = PlayerSnapshot{};
  if (!sim_) {
    return false;
  }
  const World& w = sim_->world();
  if (!w.valid(w.player)) {
    return false;
  }
  const auto* t = w.registry.try_get<Transform>(w.player);
  if (!t) {
    return false;
  }
  out.valid = true;
  out.x = t->pos.x;
  out.y = t->pos.y;
  if (const auto* b = w.registry.try_get<PhysicsBody>(w.player)) {
    out.vx = b->velocity.x;
    out.vy = b->velocity.y;
    out.grounded = b->grounded;
  }
  return true;
}
