#include "config.hpp"

#include "ini.hpp"

#include <cstdio>
#include <strings.h>
#include <unordered_map>

// Short names accepted on top of SDL's own key names ("A", "Escape", "Left Shift", ...).
static SDL_Scancode scancode_from_name(const std::string& name) {
    static const struct {
        const char* alias;
        const char* sdl;
    } aliases[] = {
        {"LSHIFT", "Left Shift"}, {"RSHIFT", "Right Shift"}, {"LCTRL", "Left Ctrl"},
        {"RCTRL", "Right Ctrl"},  {"LALT", "Left Alt"},      {"ESC", "Escape"},
        {"ENTER", "Return"},
    };
    for (auto const& a : aliases) {
        if (strcasecmp(name.c_str(), a.alias) == 0)
            return SDL_GetScancodeFromName(a.sdl);
    }
    return SDL_GetScancodeFromName(name.c_str());
}

bool load_input_bindings_from_ini(const std::string& path, InputBindings& out) {
    static const std::unordered_map<std::string, SDL_Scancode InputBindings::*> slots = {
        {"left", &InputBindings::left},
        {"right", &InputBindings::right},
        {"up", &InputBindings::up},
        {"down", &InputBindings::down},
        {"reload", &InputBindings::reload},
        {"heal", &InputBindings::heal},
        {"interact", &InputBindings::interact},
        {"toggle_mode", &InputBindings::toggle_mode},
        {"next_weapon", &InputBindings::next_weapon},
        {"prev_weapon", &InputBindings::prev_weapon},
        {"cycle_throwable", &InputBindings::cycle_throwable},
        {"throw", &InputBindings::throw_key},
        {"drop", &InputBindings::drop},
        {"pause", &InputBindings::pause},
    };
    InputBindings b = out;
    bool ok = read_ini(path, [&](const std::string& key, const std::string& val, int line) {
        auto slot = slots.find(key);
        if (slot == slots.end()) {
            std::fprintf(stderr, "[config] %s:%d: unknown action '%s'\n", path.c_str(), line, key.c_str());
            return;
        }
        SDL_Scancode sc = scancode_from_name(val);
        if (sc == SDL_SCANCODE_UNKNOWN) {
            std::fprintf(stderr, "[config] %s:%d: unknown key '%s' for %s\n", path.c_str(), line, val.c_str(),
                         key.c_str());
            return;
        }
        b.*(slot->second) = sc;
    });
    if (ok)
        out = b;
    return ok;
}
