#pragma once

#include <vector>

#include "ecs/Entity.h"

class Diagnostics;
class ObjectPools;
class PlatformerController;
class SpatialIndex;
class World;
struct PhysicsConfig;
struct TimeStep;

namespace Systems {
// Clear and repopulate the broad phase from current bounds, inflated by `skin`.
void rebuildIndex(World& w, SpatialIndex& index, float skin, Diagnostics& diag);
void integrate(World& w, const PhysicsConfig& cfg, TimeStep ts, Diagnostics& diag);
// Per-entity behavior dispatch. Entities returned to a pool are appended to `released`.
void behaviors(World& w,
               PlatformerController& platformer,
               ObjectPools& pools,
               TimeStep ts,
               Diagnostics& diag,
               std::vector<EntityId>& released);
}  // namespace Systems
