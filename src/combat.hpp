#pragma once

#include "entities.hpp"
#include "weapons.hpp"

#include <glm/glm.hpp>

struct World;

// Damage application. Health is clamped at zero here and nowhere else.
void damage_enemy(Enemy& e, float amount);
void damage_player(World& world, float amount, glm::vec2 source);
// Shield mitigation for a hit coming from `source`. Returns what reaches health.
float shield_absorb(Player& p, float amount, glm::vec2 source);
bool shield_raised(const Player& p);

// Fires the player's weapon. No-op (false) on cooldown, while reloading or with an empty magazine.
bool fire_weapon(World& world, Weapon& w, float charge);
// One hitscan ray. Hits the nearest of wall/door and living target, otherwise leaves impact fx.
void hitscan_pellet(World& world, glm::vec2 origin, float angle, float damage, Owner owner, bool incendiary);
Bullet* spawn_bullet(World& world, glm::vec2 pos, glm::vec2 dir, float speed, float radius, float damage,
                     Owner owner);
void sim_bullets(World& world, float dt);

// Falloff blast occluded per target by dynamic segments.
void blast(World& world, glm::vec2 center, float radius, float enemy_damage, float player_damage,
           bool destroy_locked_doors);
// Picks the center that catches the most enemies near `at`, then damages and bleeds them.
void airburst(World& world, glm::vec2 at);
float flash_duration(float facing, glm::vec2 victim, glm::vec2 source);
void flash(World& world, glm::vec2 pos, float radius);

void start_melee(World& world);
void sim_melee(World& world, float dt);
void shield_bash(World& world);
