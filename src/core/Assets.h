#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// Opaque reference to an asset owned by the external loader. Index 0 is "no asset".
struct AssetHandle {
  std::uint32_t id = 0;

  [[nodiscard]] bool valid() const { return id != 0; }
  bool operator==(const AssetHandle&) const = default;
};

enum class AssetStatus : std::uint8_t { Pending, Ready, Failed };

struct AssetResolution {
  AssetStatus status = AssetStatus::Pending;
  AssetHandle handle{};
};

// Boundary between the simulation and the asset loader.
//
// The simulation registers references at scene load and afterwards only reads handle
// status. The loader (possibly on another thread) fetches pending() and reports
// markReady()/markFailed(). Status reads are lock-free; registration takes a mutex.
class AssetResolver {
 public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  explicit AssetResolver(std::size_t capacity = kDefaultCapacity);

  AssetResolver(const AssetResolver&) = delete;
  AssetResolver& operator=(const AssetResolver&) = delete;

  // Returns the handle for `ref`, registering it as Pending on first use.
  // Empty refs give an invalid handle. A full table gives an invalid handle and logs.
  AssetHandle request(std::string_view ref);

  AssetResolution resolve(std::string_view ref);
  [[nodiscard]] AssetStatus status(AssetHandle h) const;

  // Loader side.
  [[nodiscard]] std::vector<AssetHandle> pending() const;
  [[nodiscard]] std::string refOf(AssetHandle h) const;
  bool markReady(AssetHandle h);
  bool markFailed(AssetHandle h, std::string_view reason);

  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::size_t size() const;

 private:
  std::size_t capacity_ = 0;
  std::unique_ptr<std::atomic<std::uint8_t>[]> status_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::uint32_t> byRef_;
  std::vector<std::string> refs_;  // refs_[id - 1]
};
