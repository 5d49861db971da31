#pragma once

#include <glm/glm.hpp>
#include <string>

struct World;
struct Weapon;

// One tick of local input, already mapped from devices by the host.
struct PlayerCommands {
    glm::vec2 move{0.0f, 0.0f};
    glm::vec2 aim_point{0.0f, 0.0f};
    bool fire{false};
    bool reload{false};
    bool heal{false};
    bool toggle_mode{false};
    int switch_weapon{0}; // +1 next, -1 previous
    int select_weapon{-1};
    bool throw_held{false};
    bool cycle_throwable{false};
    bool interact{false};
    bool interact_reverse{false};
    bool drop_weapon{false};
    std::string buy_weapon;
    std::string pickup_weapon;
};

bool start_reload(Weapon& w);
void finish_reload(Weapon& w);
bool start_heal(World& world);
bool try_takedown(World& world);

void sim_player(World& world, const PlayerCommands& cmd, float dt);
