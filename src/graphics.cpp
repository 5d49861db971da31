#include "graphics.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

static void log_sdl_error(const char* what, const char* detail = nullptr) {
    const char* err = SDL_GetError();
    std::fprintf(stderr, "[sdl] %s%s%s failed: %s\n", what, detail ? " " : "", detail ? detail : "",
                 (err && *err) ? err : "(no error text)");
}

static bool start_video(const char* driver) {
    if (driver)
        setenv("SDL_VIDEODRIVER", driver, 1);
    if (SDL_Init(SDL_INIT_VIDEO) == 0)
        return true;
    log_sdl_error("SDL_Init", driver ? driver : "auto");
    return false;
}

// Drivers to try in order. nullptr lets SDL pick.
static std::vector<const char*> driver_candidates() {
    std::vector<const char*> out;
    const char* forced = std::getenv("SDL_VIDEODRIVER");
    if (forced && *forced && std::strcmp(forced, "dummy") != 0)
        out.push_back(forced);
    else
        unsetenv("SDL_VIDEODRIVER");
    out.push_back(nullptr);
    const char* x11 = std::getenv("DISPLAY");
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    if (x11 && *x11)
        out.push_back("x11");
    if (wayland && *wayland)
        out.push_back("wayland");
    return out;
}

bool init_graphics(Graphics& gfx, bool headless, const char* title, int width, int height) {
    gfx = Graphics{};
    gfx.window_dims = {static_cast<unsigned int>(width), static_cast<unsigned int>(height)};
    if (headless)
        return start_video("dummy");

    bool up = false;
    for (const char* d : driver_candidates()) {
        if ((up = start_video(d)))
            break;
    }
    if (!up)
        return false;

    gfx.window = SDL_CreateWindow(title, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, width, height,
                                  SDL_WINDOW_RESIZABLE);
    if (!gfx.window) {
        log_sdl_error("SDL_CreateWindow");
        return false;
    }
    gfx.renderer = SDL_CreateRenderer(gfx.window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!gfx.renderer) {
        log_sdl_error("SDL_CreateRenderer", "accelerated");
        gfx.renderer = SDL_CreateRenderer(gfx.window, -1, SDL_RENDERER_SOFTWARE);
    }
    if (!gfx.renderer) {
        log_sdl_error("SDL_CreateRenderer", "software");
        return false;
    }
    // Overlays (flash, smoke) draw with alpha.
    SDL_SetRenderDrawBlendMode(gfx.renderer, SDL_BLENDMODE_BLEND);

    const char* active = SDL_GetCurrentVideoDriver();
    std::printf("[sdl] video driver: %s\n", active ? active : "(none)");
    return true;
}

void shutdown_graphics(Graphics& gfx) {
    if (gfx.renderer)
        SDL_DestroyRenderer(gfx.renderer);
    if (gfx.window)
        SDL_DestroyWindow(gfx.window);
    gfx.renderer = nullptr;
    gfx.window = nullptr;
}
