#pragma once

#include "geometry.hpp"
#include "settings.hpp"

#include <glm/glm.hpp>
#include <optional>
#include <vector>

struct World;

struct Door {
    int id{0};
    glm::vec2 hinge{0.0f, 0.0f};
    float length{0.0f};
    float thickness{WALL_THICKNESS};
    float closed_angle{0.0f};
    float angle{0.0f};
    float max_open{PI * 0.5f};
    int swing_dir{1};
    float angular_vel{0.0f};
    std::optional<float> target_angle{};
    bool locked{false};
    bool held{false};
    double last_sound_time{-1.0};
};

glm::vec2 door_end(const Door& d, float angle);
inline glm::vec2 door_end(const Door& d) { return door_end(d, d.angle); }
glm::vec2 door_mid(const Door& d);
float door_min_angle(const Door& d);
float door_max_angle(const Door& d);
float door_open_angle(const Door& d);
bool door_is_closed(const Door& d);

// Static wall edges plus one segment per door at its current angle.
std::vector<Segment> build_dynamic_segments(const std::vector<Wall>& walls, const std::vector<Door>& doors);

// Hand push while the interact command is held. `dir` is +1 or -1 along the swing direction.
void door_push(Door& d, float dir);
// Toggles the target between open and closed.
void door_toggle(Door& d);
void door_auto_open(Door& d);

void sim_doors(World& world, float dt);
