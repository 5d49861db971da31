#pragma once

#include "player.hpp"

struct World;

// One fixed-order simulation step. `frame_dt` is clamped to the configured maximum.
// Returns false when nothing was simulated (paused or mission over).
bool sim_tick(World& world, const PlayerCommands& cmd, float frame_dt);

// Transient effects, status damage-over-time, remote peers.
void sim_effects(World& world, float dt);
void update_mission(World& world);
