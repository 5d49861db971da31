#include "input_system.hpp"

static bool is_down(SDL_Scancode sc) {
    const Uint8* ks = SDL_GetKeyboardState(nullptr);
    return ks[sc] != 0;
}

static bool edge(bool now, bool& prev) {
    bool e = now && !prev;
    prev = now;
    return e;
}

void process_events(const SDL_Event& ev, InputContext& ctx, bool& request_quit) {
    switch (ev.type) {
    case SDL_QUIT:
        request_quit = true;
        break;
    case SDL_WINDOWEVENT:
        if (ev.window.event == SDL_WINDOWEVENT_CLOSE)
            request_quit = true;
        break;
    default:
        break;
    }
    int mx = 0, my = 0;
    Uint32 mbtn = SDL_GetMouseState(&mx, &my);
    ctx.mouse_left = (mbtn & SDL_BUTTON(SDL_BUTTON_LEFT)) != 0;
    ctx.mouse_right = (mbtn & SDL_BUTTON(SDL_BUTTON_RIGHT)) != 0;
    ctx.mouse = {mx, my};
}

PlayerCommands build_commands(const InputBindings& bind, InputContext& ctx, glm::uvec2 window_dims,
                              glm::vec2 world_size, bool& toggle_pause) {
    PlayerCommands c{};
    if (is_down(bind.left))
        c.move.x -= 1.0f;
    if (is_down(bind.right))
        c.move.x += 1.0f;
    if (is_down(bind.up))
        c.move.y -= 1.0f;
    if (is_down(bind.down))
        c.move.y += 1.0f;

    glm::vec2 win{static_cast<float>(window_dims.x > 0 ? window_dims.x : 1u),
                  static_cast<float>(window_dims.y > 0 ? window_dims.y : 1u)};
    c.aim_point = glm::vec2(ctx.mouse) / win * world_size;

    c.fire = ctx.mouse_left;
    c.throw_held = is_down(bind.throw_key);
    c.heal = is_down(bind.heal);
    c.interact = is_down(bind.interact);
    c.interact_reverse = ctx.mouse_right || is_down(SDL_SCANCODE_LSHIFT);

    c.reload = edge(is_down(bind.reload), ctx.prev_reload);
    c.toggle_mode = edge(is_down(bind.toggle_mode), ctx.prev_toggle);
    c.cycle_throwable = edge(is_down(bind.cycle_throwable), ctx.prev_cycle);
    c.drop_weapon = edge(is_down(bind.drop), ctx.prev_drop);
    bool next = edge(is_down(bind.next_weapon), ctx.prev_next);
    bool prev = edge(is_down(bind.prev_weapon), ctx.prev_prev);
    c.switch_weapon = next ? 1 : (prev ? -1 : 0);

    toggle_pause = edge(is_down(bind.pause), ctx.prev_pause);
    return c;
}
