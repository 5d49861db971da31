#pragma once

#include "entities.hpp"
#include "weapons.hpp"

#include <array>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

// Level data is authored in fractions of the world size; lengths of doors in fractions of height.
struct WallDef {
    float x{0.0f}, y{0.0f}, w{0.0f}, h{0.0f};
};

struct DoorDef {
    int id{0};
    glm::vec2 hinge{0.0f, 0.0f};
    float length{0.1f};
    float closed_angle{0.0f};
    float max_open_angle{1.4137167f}; // 0.45 pi
    int swing_direction{1};
    bool locked{false};
};

struct SpawnDef {
    glm::vec2 pos{0.0f, 0.0f};
    float direction{0.0f};
    EnemyType type{EnemyType::Standard};
};

struct LevelDef {
    std::string name;
    std::string description;
    glm::vec2 size{WORLD_WIDTH, WORLD_HEIGHT};
    glm::vec2 player_start{0.5f, 0.5f};
    std::vector<WallDef> walls;
    std::vector<DoorDef> doors;
    std::vector<SpawnDef> enemies;
    // enemy_count_min < 0 spawns the whole list.
    int enemy_count_min{-1};
    int enemy_count_max{-1};
    std::optional<WallDef> extraction{};
};

struct WeaponChoice {
    std::string name;
    std::vector<std::string> attachments;
};

struct Loadout {
    WeaponChoice primary{};
    WeaponChoice secondary{};
    MeleeKind melee{MeleeKind::Blade};
    std::array<int, THROWABLE_KIND_COUNT> throwables{};
    int medkits{0};
};

// Box arena with no enemies.
LevelDef default_level_def();
