#include "core/App.h"

#include <SDL3/SDL_hints.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

#include "util/Paths.h"

namespace {

void usage(const char* argv0) {
  std::printf(
      "usage: %s [--scene PATH] [--config PATH] [--input-script PATH] [--assets DIR] "
      "[--headless] [--frames N] [--video-driver NAME] [--width W] [--height H]\n",
      argv0);
  std::printf("  --scene PATH         Scene TOML (default: data/scenes/demo.toml)\n");
  std::printf("  --config PATH        Simulation TOML (default: data/config/sim.toml)\n");
  std::printf("  --input-script PATH  Scripted input TOML (replaces keyboard/gamepad)\n");
  std::printf("  --assets DIR         Root for asset references (default: data)\n");
  std::printf("  --headless           No window; fixed 1/60 s frames\n");
  std::printf("  --frames N           Run N frames then exit (smoke test)\n");
  std::printf("  --video-driver NAME  Force SDL video backend (e.g. x11, wayland, offscreen)\n");
  std::printf("  --width W            Window width (default: 1280)\n");
  std::printf("  --height H           Window height (default: 720)\n");
  std::printf("  -h, --help           Show this help\n");
}

bool parseInt(const char* s, int& out) {
  if (!s || !*s) {
    return false;
  }
  char* end = nullptr;
  const long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0') {
    return false;
  }
  if (v < 1 || v > 1000000) {
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  AppConfig cfg{};
  const char* videoDriver = nullptr;
  std::string scenePath = Paths::resolveDataPath("data/scenes/demo.toml", argv[0]);
  std::string configPath = Paths::resolveDataPath("data/config/sim.toml", argv[0]);
  std::string scriptPath;
  std::string assetDir = Paths::resolveDataPath("data", argv[0]);

  auto needValue = [&](int i, const char* name) {
    if (i + 1 >= argc) {
      std::printf("missing %s value\n", name);
      usage(argv[0]);
      return false;
    }
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "--frames") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.maxFrames)) {
        std::printf("invalid --frames value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--headless") {
      cfg.headless = true;
    } else if (arg == "--scene") {
      if (!needValue(i, "--scene")) {
        return 1;
      }
      scenePath = argv[++i];
    } else if (arg == "--config") {
      if (!needValue(i, "--config")) {
        return 1;
      }
      configPath = argv[++i];
    } else if (arg == "--input-script") {
      if (!needValue(i, "--input-script")) {
        return 1;
      }
      scriptPath = argv[++i];
    } else if (arg == "--assets") {
      if (!needValue(i, "--assets")) {
        return 1;
      }
      assetDir = argv[++i];
    } else if (arg == "--video-driver") {
      if (!needValue(i, "--video-driver")) {
        return 1;
      }
      videoDriver = argv[++i];
    } else if (arg == "--width") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.width)) {
        std::printf("invalid --width value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "--height") {
      if (i + 1 >= argc || !parseInt(argv[i + 1], cfg.height)) {
        std::printf("invalid --height value\n");
        usage(argv[0]);
        return 1;
      }
      ++i;
    } else if (arg == "-h" || arg == "--help") {
      usage(argv[0]);
      return 0;
    } else {
      std::printf("unknown option: %s\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  if (cfg.headless && cfg.maxFrames <= 0) {
    std::printf("--headless requires --frames N\n");
    return 1;
  }

  if (videoDriver) {
    SDL_SetHint(SDL_HINT_VIDEO_DRIVER, videoDriver);
  }

  cfg.scenePath = scenePath.c_str();
  if (Paths::pathExists(configPath)) {
    cfg.simConfigPath = configPath.c_str();
  }
  cfg.inputScriptPath = scriptPath.empty() ? nullptr : scriptPath.c_str();
  cfg.assetDir = assetDir;

  App app;
  if (!app.init(cfg)) {
    app.shutdown();
    return 1;
  }

  app.run();

  if (cfg.maxFrames > 0) {
    App::PlayerSnapshot p{};
    const App::Stats& s = app.stats();
    if (app.playerSnapshot(p)) {
      std::printf("player x=%.2f y=%.2f vx=%.2f vy=%.2f grounded=%d\n", p.x, p.y, p.vx, p.vy,
                  p.grounded ? 1 : 0);
    }
    std::printf("frames=%llu ticks=%llu audio=%llu overlaps=%llu\n",
                static_cast<unsigned long long>(s.frames), static_cast<unsigned long long>(s.ticks),
                static_cast<unsigned long long>(s.audioEvents),
                static_cast<unsigned long long>(s.overlapEvents));
  }

  app.shutdown();
  return 0;
}
