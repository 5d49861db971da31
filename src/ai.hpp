#pragma once

#include <glm/glm.hpp>

struct World;
struct Enemy;
struct Door;

// Distance, optional field-of-view cone, walls/doors and smoke.
bool enemy_can_see(const World& world, const Enemy& e, glm::vec2 point, bool use_fov);
bool smoke_blocks(const World& world, glm::vec2 a, glm::vec2 b);
// Player holds the far side of a closed door close enough to ambush whoever opens it.
bool player_camping_door(const World& world, const Door& d, const Enemy& e);

// Perception and behavior for every enemy, then removal of the dead.
void sim_enemies(World& world, float dt);
