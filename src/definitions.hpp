#pragma once

#include "level.hpp"
#include "weapons.hpp"

#include <string>
#include <vector>

// Everything the data scripts register. Lookups never fail: a missing entry yields a default.
struct Definitions {
    std::vector<WeaponDef> weapons;
    std::vector<ThrowableDef> throwables;
    std::vector<LevelDef> levels;

    const WeaponDef* find_weapon(const std::string& name) const;
    const ThrowableDef* find_throwable(ThrowableKind kind) const;
    const LevelDef* find_level(const std::string& name) const;
    WeaponDef weapon_or_default(const std::string& name) const;
    ThrowableDef throwable_or_default(ThrowableKind kind) const;
    LevelDef level_or_default(const std::string& name) const;
};
