#include "config.hpp"
#include "graphics.hpp"
#include "input_system.hpp"
#include "luamgr.hpp"
#include "net.hpp"
#include "render.hpp"
#include "runtime_settings.hpp"
#include "sim.hpp"
#include "world.hpp"

#include <SDL2/SDL.h>
#include <cstdio>
#include <cstdlib>
#include <string>

#ifndef BREACH_DATA_DIR
#define BREACH_DATA_DIR "data"
#endif

static Loadout default_loadout() {
    Loadout l{};
    l.primary.name = "Assault Rifle";
    l.secondary.name = "Pistol";
    l.melee = MeleeKind::Blade;
    l.throwables = {2, 2, 1, 1};
    l.medkits = 2;
    return l;
}

int main(int argc, char** argv) {
    bool arg_headless = false;
    long arg_frames = -1; // <0 => unlimited
    std::string arg_level = "office";
    std::string arg_data = BREACH_DATA_DIR;
    std::string arg_primary;
    bool arg_shield = false;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--headless")
            arg_headless = true;
        else if (a == "--shield")
            arg_shield = true;
        else if (a.rfind("--frames=", 0) == 0)
            arg_frames = std::strtol(a.c_str() + 9, nullptr, 10);
        else if (a.rfind("--level=", 0) == 0)
            arg_level = a.substr(8);
        else if (a.rfind("--data=", 0) == 0)
            arg_data = a.substr(7);
        else if (a.rfind("--primary=", 0) == 0)
            arg_primary = a.substr(10);
        else
            std::fprintf(stderr, "unknown argument: %s\n", a.c_str());
    }
    // Headless without a frame limit would never exit.
    if (arg_headless && arg_frames < 0)
        arg_frames = 600;

    const char* title = "breach";
    int width = static_cast<int>(WORLD_WIDTH);
    int height = static_cast<int>(WORLD_HEIGHT);

    Graphics gfx{};
    if (!init_graphics(gfx, arg_headless, title, width, height)) {
        SDL_Quit();
        return 1;
    }

    LuaManager lua;
    if (!lua.init()) {
        std::fprintf(stderr, "Lua not available. Exiting.\n");
        shutdown_graphics(gfx);
        SDL_Quit();
        return 1;
    }
    if (!lua.load_scripts(arg_data))
        std::fprintf(stderr, "[lua] running with built-in defaults\n");

    RuntimeSettings settings{};
    std::string settings_path = arg_data + "/config/settings.ini";
    if (!load_runtime_settings_from_ini(settings_path, settings))
        std::fprintf(stderr, "[config] %s not found, using defaults\n", settings_path.c_str());

    InputBindings binds{};
    std::string binds_path = arg_data + "/config/bindings.ini";
    if (!load_input_bindings_from_ini(binds_path, binds))
        std::fprintf(stderr, "[config] %s not found, using default bindings\n", binds_path.c_str());

    const Definitions& defs = lua.defs();
    LevelDef level = defs.level_or_default(arg_level);
    Loadout loadout = default_loadout();
    if (!arg_primary.empty())
        loadout.primary.name = arg_primary;
    if (arg_shield)
        loadout.melee = MeleeKind::Shield;

    World world{};
    init_world(world, level, loadout, defs, settings);

    InputContext ictx{};
    Uint64 perf_freq = SDL_GetPerformanceFrequency();
    Uint64 t_last = SDL_GetPerformanceCounter();
    double accum_sec = 0.0;
    int frame_counter = 0;
    bool running = true;
    while (running) {
        SDL_Event ev;
        bool request_quit = false;
        while (SDL_PollEvent(&ev))
            process_events(ev, ictx, request_quit);
        if (request_quit)
            running = false;

        Uint64 t_now = SDL_GetPerformanceCounter();
        double dt_sec = static_cast<double>(t_now - t_last) / static_cast<double>(perf_freq);
        t_last = t_now;

        PlayerCommands cmd{};
        if (arg_headless) {
            // Fixed step so headless runs are reproducible for a given seed.
            dt_sec = 1.0 / 60.0;
            cmd.aim_point = world.player.pos + glm::vec2(1.0f, 0.0f);
        } else {
            bool toggle_pause = false;
            cmd = build_commands(binds, ictx, gfx.window_dims, world.size, toggle_pause);
            if (toggle_pause) {
                world.paused = !world.paused;
                std::printf("[game] %s\n", world.paused ? "paused" : "resumed");
            }
        }

        bool was_over = world.game_over || world.mission_complete;
        sim_tick(world, cmd, static_cast<float>(dt_sec));
        flush_outbox(world, nullptr);
        if (!was_over && world.game_over)
            std::printf("[game] player down at %.1fs\n", world.now);
        if (!was_over && world.mission_complete)
            std::printf("[game] mission complete at %.1fs\n", world.now);

        if (!arg_headless)
            render_frame(gfx, world);

        accum_sec += dt_sec;
        frame_counter += 1;
        if (accum_sec >= 1.0) {
            accum_sec -= 1.0;
            char tmp[96];
            std::snprintf(tmp, sizeof(tmp), "breach - FPS: %d - hostiles: %d", frame_counter,
                          world.enemies.living());
            frame_counter = 0;
            if (gfx.window)
                SDL_SetWindowTitle(gfx.window, tmp);
        }

        if (arg_frames >= 0) {
            if (--arg_frames <= 0)
                running = false;
        }
    }

    std::printf("[game] frames=%u time=%.2fs health=%.0f hostiles=%d/%d%s%s\n", world.frame, world.now,
                static_cast<double>(world.player.health), world.enemies.living(), world.initial_enemies,
                world.game_over ? " game_over" : "", world.mission_complete ? " complete" : "");
    shutdown_graphics(gfx);
    SDL_Quit();
    return 0;
}
