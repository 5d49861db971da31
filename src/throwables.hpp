#pragma once

#include "weapons.hpp"

#include <glm/glm.hpp>

struct World;

// Launches toward `target` with power min(dist / 20, 15) and the fuse time left after cooking.
bool throw_throwable(World& world, ThrowableKind kind, glm::vec2 from, glm::vec2 target, float fuse_left);
void detonate_throwable(World& world, ThrowableKind kind, glm::vec2 pos);
void sim_throwables(World& world, float dt);
