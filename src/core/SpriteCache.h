#pragma once

#include <SDL3/SDL_render.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>

#include "core/Assets.h"

// Host-side loader behind the AssetResolver: fulfils pending handles and owns the textures.
// BMP (magenta color key) loads through SDL, PNG through stb_image. Without a renderer
// (headless) images are decoded and dropped, and other assets only need to exist on disk.
class SpriteCache {
 public:
  void init(SDL_Renderer* renderer, std::filesystem::path baseDir);
  void shutdown();

  // Loads every pending handle and reports it Ready or Failed. Returns how many were handled.
  std::size_t fulfil(AssetResolver& assets);

  [[nodiscard]] SDL_Texture* texture(AssetHandle h) const;

 private:
  bool loadOne(const AssetResolver& assets, AssetHandle h, std::string& error);

  SDL_Renderer* renderer_ = nullptr;
  std::filesystem::path baseDir_;
  std::unordered_map<std::uint32_t, SDL_Texture*> textures_;
};
