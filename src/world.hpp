#pragma once

#include "definitions.hpp"
#include "doors.hpp"
#include "entities.hpp"
#include "geometry.hpp"
#include "level.hpp"
#include "net.hpp"
#include "runtime_settings.hpp"

#include <array>
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <random>
#include <vector>

// All simulation state. Only the tick mutates it; hosts read it between ticks.
struct World {
    glm::vec2 size{WORLD_WIDTH, WORLD_HEIGHT};
    std::vector<Wall> walls;
    std::vector<Door> doors;
    // Dynamic segments for the current tick.
    std::vector<Segment> segments;
    std::uint64_t segment_rebuilds{0};

    Player player{};
    Enemies enemies{};
    Bullets bullets{};
    Throwables throwables{};
    MeleeSwing swing{};

    std::vector<SoundEvent> sounds;
    Effects fx{};
    std::vector<SmokeCloud> smoke;
    std::vector<FireZone> fires;

    std::optional<Wall> extraction{};
    bool extraction_active{false};
    bool paused{false};
    bool game_over{false};
    bool mission_complete{false};
    int initial_enemies{0};

    double now{0.0};
    std::uint32_t frame{0};
    std::uint32_t sound_serial{0};

    RuntimeSettings settings{};
    std::vector<WeaponDef> catalog;
    std::array<ThrowableDef, THROWABLE_KIND_COUNT> throwable_defs{};
    std::mt19937 rng{};

    // Player vision polygon from the end of the last tick.
    std::vector<glm::vec2> player_view;

    NetState net{};
};

void init_world(World& world, const LevelDef& level, const Loadout& loadout, const Definitions& defs,
                const RuntimeSettings& settings);

float far_distance(const World& world);
float frand(World& world); // [0, 1)
Weapon* active_weapon(Player& p);
const ThrowableDef& throwable_def(const World& world, ThrowableKind kind);

void emit_sound(World& world, glm::vec2 pos, float max_radius, float lifetime, SoundType type);
void add_light(World& world, glm::vec2 pos, float radius, float power, float ttl, LightKind kind);
void spawn_sparks(World& world, glm::vec2 pos, int count);

// Walls plus door capsules.
bool circle_blocked(const World& world, glm::vec2 c, float r);
void resolve_unit_collisions(const World& world, glm::vec2& pos, float r, int iterations);
