#pragma once

#include "player.hpp"

#include <SDL2/SDL.h>
#include <glm/glm.hpp>

struct InputBindings {
    SDL_Scancode left = SDL_SCANCODE_A;
    SDL_Scancode right = SDL_SCANCODE_D;
    SDL_Scancode up = SDL_SCANCODE_W;
    SDL_Scancode down = SDL_SCANCODE_S;

    SDL_Scancode reload = SDL_SCANCODE_R;
    SDL_Scancode heal = SDL_SCANCODE_H;
    SDL_Scancode interact = SDL_SCANCODE_E;
    SDL_Scancode toggle_mode = SDL_SCANCODE_Q;
    SDL_Scancode next_weapon = SDL_SCANCODE_2;
    SDL_Scancode prev_weapon = SDL_SCANCODE_1;
    SDL_Scancode cycle_throwable = SDL_SCANCODE_G;
    SDL_Scancode throw_key = SDL_SCANCODE_F;
    SDL_Scancode drop = SDL_SCANCODE_X;
    SDL_Scancode pause = SDL_SCANCODE_ESCAPE;
};

// Per-frame device state plus the previous frame's keys for edge detection.
struct InputContext {
    glm::ivec2 mouse{0, 0};
    bool mouse_left{false};
    bool mouse_right{false};
    bool prev_toggle{false};
    bool prev_next{false};
    bool prev_prev{false};
    bool prev_cycle{false};
    bool prev_drop{false};
    bool prev_reload{false};
    bool prev_pause{false};
};

void process_events(const SDL_Event& ev, InputContext& ctx, bool& request_quit);

// Maps keyboard and mouse to one tick of commands. The aim point is scaled from
// window pixels to world units. Sets `toggle_pause` on the pause key edge.
PlayerCommands build_commands(const InputBindings& binds, InputContext& ctx, glm::uvec2 window_dims,
                              glm::vec2 world_size, bool& toggle_pause);
