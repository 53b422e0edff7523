#include "core/Diagnostics.h"

#include <algorithm>

#include "core/Log.h"

const char* diagnosticName(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::MissingBody:
      return "missing physics body";
    case DiagnosticKind::InvalidAabb:
      return "invalid aabb";
    case DiagnosticKind::AssetFailed:
      return "asset failed";
    case DiagnosticKind::NonFiniteState:
      return "non-finite state";
    case DiagnosticKind::PoolExhausted:
      return "pool exhausted";
    case DiagnosticKind::UnknownPool:
      return "unknown pool";
  }
  return "unknown";
}

void Diagnostics::report(EntityId e, DiagnosticKind kind, std::string_view detail) {
  const Diagnostic d{e, kind};
  if (std::find(frame_.begin(), frame_.end(), d) == frame_.end()) {
    frame_.push_back(d);
  }

  if (std::find(logged_.begin(), logged_.end(), d) != logged_.end()) {
    return;
  }
  logged_.push_back(d);

  const auto raw = entityKey(e);
  if (detail.empty()) {
    Log::warnf("sim", "entity {}: {}", raw, diagnosticName(kind));
  } else {
    Log::warnf("sim", "entity {}: {} ({})", raw, diagnosticName(kind), detail);
  }
}

void Diagnostics::forget(EntityId e) {
  std::erase_if(logged_, [e](const Diagnostic& d) { return d.entity == e; });
}

void Diagnostics::reset() {
  frame_.clear();
  logged_.clear();
}
