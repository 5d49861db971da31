#include "definitions.hpp"

#include <cstdio>

const WeaponDef* Definitions::find_weapon(const std::string& name) const {
    for (auto const& w : weapons)
        if (w.name == name)
            return &w;
    return nullptr;
}

const ThrowableDef* Definitions::find_throwable(ThrowableKind kind) const {
    for (auto const& t : throwables)
        if (t.kind == kind)
            return &t;
    return nullptr;
}

const LevelDef* Definitions::find_level(const std::string& name) const {
    for (auto const& l : levels)
        if (l.name == name)
            return &l;
    return nullptr;
}

WeaponDef Definitions::weapon_or_default(const std::string& name) const {
    if (const WeaponDef* w = find_weapon(name))
        return *w;
    std::fprintf(stderr, "[lua] unknown weapon '%s', using default\n", name.c_str());
    return default_weapon_def();
}

ThrowableDef Definitions::throwable_or_default(ThrowableKind kind) const {
    if (const ThrowableDef* t = find_throwable(kind))
        return *t;
    return default_throwable_def(kind);
}

LevelDef Definitions::level_or_default(const std::string& name) const {
    if (const LevelDef* l = find_level(name))
        return *l;
    if (!name.empty())
        std::fprintf(stderr, "[level] unknown level '%s', using default arena\n", name.c_str());
    if (!levels.empty() && name.empty())
        return levels.front();
    return default_level_def();
}

LevelDef default_level_def() {
    LevelDef l{};
    l.name = "arena";
    l.description = "Empty walled box";
    const float t = 0.02f;
    l.walls.push_back({0.0f, 0.0f, 1.0f, t});
    l.walls.push_back({0.0f, 1.0f - t, 1.0f, t});
    l.walls.push_back({0.0f, 0.0f, t, 1.0f});
    l.walls.push_back({1.0f - t, 0.0f, t, 1.0f});
    return l;
}
