#include "core/SpriteCache.h"

#include <string>
#include <system_error>
#include <utility>

#include <SDL3/SDL_blendmode.h>
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_pixels.h>
#include <SDL3/SDL_render.h>
#include <SDL3/SDL_stdinc.h>
#include <SDL3/SDL_surface.h>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "core/Log.h"

namespace {

bool hasExtension(const std::filesystem::path& path, const char* lower, const char* upper) {
  const std::string ext = path.extension().string();
  return ext == lower || ext == upper;
}

// RGBA decode; the returned surface owns its pixels.
SDL_Surface* loadPngWithStb(const std::string& path, std::string& error) {
  int width = 0;
  int height = 0;
  int channels = 0;
  unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 4);
  if (!data) {
    error = std::string("stbi_load failed: ") + stbi_failure_reason();
    return nullptr;
  }

  SDL_Surface* view =
      SDL_CreateSurfaceFrom(width, height, SDL_PIXELFORMAT_RGBA32, data, width * 4);
  if (!view) {
    error = std::string("SDL_CreateSurfaceFrom failed: ") + SDL_GetError();
    stbi_image_free(data);
    return nullptr;
  }

  // SDL_CreateSurfaceFrom borrows the pixels.
  SDL_Surface* copied = SDL_DuplicateSurface(view);
  SDL_DestroySurface(view);
  stbi_image_free(data);
  if (!copied) {
    error = std::string("SDL_DuplicateSurface failed: ") + SDL_GetError();
  }
  return copied;
}

}  // namespace

void SpriteCache::init(SDL_Renderer* renderer, std::filesystem::path baseDir) {
  renderer_ = renderer;
  baseDir_ = std::move(baseDir);
}

void SpriteCache::shutdown() {
  for (auto& [id, tex] : textures_) {
    (void)id;
    if (tex) {
      SDL_DestroyTexture(tex);
    }
  }
  textures_.clear();
  renderer_ = nullptr;
}

std::size_t SpriteCache::fulfil(AssetResolver& assets) {
  const auto pending = assets.pending();
  for (const AssetHandle h : pending) {
    std::string error;
    if (loadOne(assets, h, error)) {
      assets.markReady(h);
    } else {
      assets.markFailed(h, error);
    }
  }
  return pending.size();
}

SDL_Texture* SpriteCache::texture(AssetHandle h) const {
  auto it = textures_.find(h.id);
  return (it != textures_.end()) ? it->second : nullptr;
}

bool SpriteCache::loadOne(const AssetResolver& assets, AssetHandle h, std::string& error) {
  const std::filesystem::path path = baseDir_ / assets.refOf(h);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    error = "no such file: " + path.string();
    return false;
  }

  const bool png = hasExtension(path, ".png", ".PNG");
  const bool bmp = hasExtension(path, ".bmp", ".BMP");
  // Audio files are played by the backend; the core only needs them to exist.
  if (!png && !bmp) {
    return true;
  }

  SDL_Surface* surface = nullptr;
  if (png) {
    surface = loadPngWithStb(path.string(), error);
    if (!surface) {
      return false;
    }
  } else {
    surface = SDL_LoadBMP(path.string().c_str());
    if (!surface) {
      error = std::string("SDL_LoadBMP failed: ") + SDL_GetError();
      return false;
    }
    // Magenta is transparent.
    const Uint32 key = SDL_MapSurfaceRGB(surface, 255, 0, 255);
    (void)SDL_SetSurfaceColorKey(surface, true, key);
  }

  if (!renderer_) {
    SDL_DestroySurface(surface);
    return true;
  }

  SDL_Texture* tex = SDL_CreateTextureFromSurface(renderer_, surface);
  SDL_DestroySurface(surface);
  if (!tex) {
    error = std::string("SDL_CreateTextureFromSurface failed: ") + SDL_GetError();
    return false;
  }

  (void)SDL_SetTextureScaleMode(tex, SDL_SCALEMODE_NEAREST);
  (void)SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
  textures_[h.id] = tex;
  Log::infof("assets", "loaded {}", path.string());
  return true;
}
