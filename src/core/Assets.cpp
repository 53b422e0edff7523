#include "core/Assets.h"

#include <string>
#include <utility>

#include "core/Log.h"

AssetResolver::AssetResolver(std::size_t capacity)
    : capacity_(capacity), status_(std::make_unique<std::atomic<std::uint8_t>[]>(capacity)) {
  for (std::size_t i = 0; i < capacity_; ++i) {
    status_[i].store(static_cast<std::uint8_t>(AssetStatus::Pending), std::memory_order_relaxed);
  }
  refs_.reserve(capacity_);
}

AssetHandle AssetResolver::request(std::string_view ref) {
  if (ref.empty()) {
    return AssetHandle{};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::string key(ref);
  if (auto it = byRef_.find(key); it != byRef_.end()) {
    return AssetHandle{it->second};
  }

  if (refs_.size() >= capacity_) {
    Log::errorf("assets", "asset table full ({} entries); '{}' will not resolve", capacity_, ref);
    return AssetHandle{};
  }

  const auto id = static_cast<std::uint32_t>(refs_.size() + 1);
  refs_.push_back(key);
  byRef_.emplace(std::move(key), id);
  return AssetHandle{id};
}

AssetResolution AssetResolver::resolve(std::string_view ref) {
  const AssetHandle h = request(ref);
  return AssetResolution{status(h), h};
}

AssetStatus AssetResolver::status(AssetHandle h) const {
  if (!h.valid() || h.id > capacity_) {
    return AssetStatus::Failed;
  }
  return static_cast<AssetStatus>(status_[h.id - 1].load(std::memory_order_acquire));
}

std::vector<AssetHandle> AssetResolver::pending() const {
  std::vector<AssetHandle> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < refs_.size(); ++i) {
    if (status_[i].load(std::memory_order_acquire) ==
        static_cast<std::uint8_t>(AssetStatus::Pending)) {
      out.push_back(AssetHandle{static_cast<std::uint32_t>(i + 1)});
    }
  }
  return out;
}

std::string AssetResolver::refOf(AssetHandle h) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!h.valid() || h.id > refs_.size()) {
    return {};
  }
  return refs_[h.id - 1];
}

bool AssetResolver::markReady(AssetHandle h) {
  if (!h.valid() || h.id > size()) {
    return false;
  }
  status_[h.id - 1].store(static_cast<std::uint8_t>(AssetStatus::Ready), std::memory_order_release);
  return true;
}

bool AssetResolver::markFailed(AssetHandle h, std::string_view reason) {
  if (!h.valid() || h.id > size()) {
    return false;
  }
  status_[h.id - 1].store(static_cast<std::uint8_t>(AssetStatus::Failed),
                          std::memory_order_release);
  Log::warnf("assets", "'{}' failed to load: {}", refOf(h), reason);
  return true;
}

std::size_t AssetResolver::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return refs_.size();
}
