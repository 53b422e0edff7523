#include "core/DebugUI.h"

#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_sdlrenderer3.h>

#include <memory>
#include <string>

#include <SDL3/SDL_filesystem.h>
#include <SDL3/SDL_stdinc.h>

bool DebugUI::init(SDL_Window* window, SDL_Renderer* renderer) {
  if (initialized_)
    return true;

  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGui::StyleColorsDark();

  ImGuiIO& io = ImGui::GetIO();
  iniPath_.clear();
  using PrefPathPtr = std::unique_ptr<char, decltype(&SDL_free)>;
  PrefPathPtr prefPath{SDL_GetPrefPath("platcore", "host"), SDL_free};
  if (prefPath) {
    iniPath_ = std::string(prefPath.get()) + "imgui.ini";
    io.IniFilename = iniPath_.c_str();  // persist layout outside the repo
  } else {
    io.IniFilename = nullptr;
  }
  io.LogFilename = nullptr;

  if (!ImGui_ImplSDL3_InitForSDLRenderer(window, renderer)) {
    ImGui::DestroyContext();
    return false;
  }

  if (!ImGui_ImplSDLRenderer3_Init(renderer)) {
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    return false;
  }

  initialized_ = true;
  return true;
}

void DebugUI::shutdown() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_Shutdown();
  ImGui_ImplSDL3_Shutdown();
  ImGui::DestroyContext();
  initialized_ = false;
}

void DebugUI::processEvent(const SDL_Event& e) {
  if (!initialized_)
    return;
  (void)ImGui_ImplSDL3_ProcessEvent(&e);
}

void DebugUI::beginFrame() {
  if (!initialized_)
    return;
  ImGui_ImplSDLRenderer3_NewFrame();
  ImGui_ImplSDL3_NewFrame();
  ImGui::NewFrame();
}

void DebugUI::endFrame(SDL_Renderer* renderer) {
  if (!initialized_)
    return;
  ImGui::Render();
  ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer);
}

bool DebugUI::wantCaptureKeyboard() const {
  if (!initialized_)
    return false;
  return ImGui::GetIO().WantCaptureKeyboard;
}

// NOLINTNEXTLINE
void DebugUI::drawOverlay(const DebugUIOverlayModel& model) {
  if (!initialized_)
    return;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 16.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.75F);

  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                                 ImGuiWindowFlags_NoFocusOnAppearing | ImGuiWindowFlags_NoNav;

  if (ImGui::Begin("Overlay", nullptr, flags)) {
    ImGui::Text("frame: %llu  ticks: %llu  dt: %.5F", static_cast<unsigned long long>(model.frame),
                static_cast<unsigned long long>(model.ticks), model.dt);
    ImGui::Text("sub-steps: %d  accumulator: %.5F  dropped: %.3F", model.subSteps,
                model.accumulator, model.droppedSeconds);
    ImGui::Text("entities: %zu  indexed: %zu  contacts: %zu  overlaps: %zu", model.entities,
                model.indexedBodies, model.contacts, model.overlaps);
    ImGui::Text("pending assets: %zu  collision view: %d  (F1 ui, F2 collision)",
                model.pendingAssets, model.debugCollision ? 1 : 0);

    if (model.hasPlayer) {
      ImGui::Separator();
      if (!model.playerName.empty())
        ImGui::Text("player: %u  name: %s", model.playerId, model.playerName.c_str());
      else
        ImGui::Text("player: %u", model.playerId);
      ImGui::Text("pos: (%.1F, %.1F)", model.posX, model.posY);
      ImGui::Text("vel: (%.1F, %.1F)", model.velX, model.velY);
      ImGui::Text("grounded: %d", model.grounded ? 1 : 0);
      if (model.hasController) {
        ImGui::Text("coyote=%.3F  jumpbuf=%.3F  shoot_cd=%.3F", model.coyoteTimer,
                    model.jumpBufferTimer, model.shootCooldown);
      }
    }
  }
  ImGui::End();
}

// NOLINTNEXTLINE
DebugUIActions DebugUI::drawInspector(const DebugUIInspectorModel& model, bool debugCollision) {
  DebugUIActions actions{};
  if (!initialized_)
    return actions;

  ImGui::SetNextWindowPos(ImVec2(16.0F, 220.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(380.0F, 420.0F), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowBgAlpha(0.90F);

  if (ImGui::Begin("Simulation")) {
    ImGui::Text("scene: %s", model.sceneId.c_str());
    ImGui::TextDisabled("%s", model.scenePath.c_str());
    if (ImGui::Button("Reload scene"))
      actions.reloadScene = true;

    bool paused = model.simPaused;
    ImGui::SameLine();
    if (ImGui::Checkbox("Paused", &paused)) {
      actions.setSimPaused = true;
      actions.simPaused = paused;
    }
    if (model.simPaused) {
      ImGui::SameLine();
      if (ImGui::Button("Step"))
        actions.stepTicks = 1;
      ImGui::SameLine();
      if (ImGui::Button("Step 10"))
        actions.stepTicks = 10;
    }

    float timeScale = model.timeScale;
    if (ImGui::SliderFloat("Time scale", &timeScale, 0.1F, 2.0F, "%.2F")) {
      actions.setTimeScale = true;
      actions.timeScale = timeScale;
    }

    bool showBodies = debugCollision;
    if (ImGui::Checkbox("Show bodies", &showBodies)) {
      actions.setDebugCollision = true;
      actions.debugCollision = showBodies;
    }

    if (ImGui::CollapsingHeader("Pools", ImGuiTreeNodeFlags_DefaultOpen)) {
      if (model.pools.empty())
        ImGui::TextDisabled("(none)");
      for (const DebugUIPoolRow& row : model.pools) {
        const float used = row.capacity > 0
                               ? static_cast<float>(row.active) / static_cast<float>(row.capacity)
                               : 0.0F;
        ImGui::Text("%s", row.name.c_str());
        ImGui::SameLine(120.0F);
        const std::string label = std::to_string(row.active) + "/" + std::to_string(row.capacity);
        ImGui::ProgressBar(used, ImVec2(-1.0F, 0.0F), label.c_str());
      }
    }

    if (ImGui::CollapsingHeader("Diagnostics", ImGuiTreeNodeFlags_DefaultOpen)) {
      if (model.diagnostics.empty())
        ImGui::TextDisabled("(none this frame)");
      for (const std::string& line : model.diagnostics)
        ImGui::TextUnformatted(line.c_str());
    }

    if (ImGui::CollapsingHeader("Controls")) {
      for (const std::string& line : model.legend)
        ImGui::TextUnformatted(line.c_str());
    }
  }
  ImGui::End();
  return actions;
}
