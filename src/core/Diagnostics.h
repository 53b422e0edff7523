#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "ecs/Entity.h"

enum class DiagnosticKind : std::uint8_t {
  MissingBody,     // controller-bearing entity without a PhysicsBody
  InvalidAabb,     // zero-area or non-finite bounds
  AssetFailed,     // visual asset failed to load; entity keeps simulating
  NonFiniteState,  // integrator reset a NaN/inf velocity or position
  PoolExhausted,   // spawn request dropped because the pool is full
  UnknownPool,     // spawn request names a pool the scene does not have
};

const char* diagnosticName(DiagnosticKind kind);

struct Diagnostic {
  EntityId entity = kInvalidEntity;
  DiagnosticKind kind = DiagnosticKind::MissingBody;
  bool operator==(const Diagnostic&) const = default;
};

// Per-entity problems found while stepping. Each (entity, kind) is listed once per frame and
// logged once until the entity is forgotten (despawned or scene unloaded).
class Diagnostics {
 public:
  void beginFrame() { frame_.clear(); }
  void report(EntityId e, DiagnosticKind kind, std::string_view detail = {});
  void forget(EntityId e);
  void reset();

  [[nodiscard]] const std::vector<Diagnostic>& frame() const { return frame_; }

 private:
  std::vector<Diagnostic> frame_;
  std::vector<Diagnostic> logged_;
};
