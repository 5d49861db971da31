#include "weapons.hpp"

#include <algorithm>
#include <cmath>

void apply_attachment(WeaponDef& w, const AttachmentDef& a) {
    w.fire_rate *= a.fire_rate;
    w.reload_time *= a.reload_time;
    w.bullet_radius = std::max(0.5f, w.bullet_radius + a.bullet_radius);
    w.pellets = std::max(1, w.pellets + a.pellets);
    if (w.mag_size > 0)
        w.mag_size = std::max(1, static_cast<int>(std::lround(static_cast<float>(w.mag_size) * a.mag_size)));
    w.spread = std::max(0.0f, w.spread * a.spread);
    w.sound_radius *= a.sound_radius;
    if (a.incendiary)
        w.incendiary = true;
}

const AttachmentDef* find_attachment(const WeaponDef& w, const std::string& name) {
    for (auto const& a : w.attachments)
        if (a.name == name)
            return &a;
    return nullptr;
}

Weapon make_weapon(const WeaponDef& def, const std::vector<std::string>& attachments) {
    Weapon w{};
    w.stats = def;
    for (auto const& n : attachments) {
        if (const AttachmentDef* a = find_attachment(def, n))
            apply_attachment(w.stats, *a);
    }
    w.mag = std::max(0, w.stats.mag_size);
    w.reserve = std::max(0, w.stats.reserve);
    return w;
}

WeaponDef default_weapon_def() {
    WeaponDef d{};
    d.name = "Sidearm";
    d.category = "secondary";
    return d;
}

ThrowableDef default_throwable_def(ThrowableKind kind) {
    ThrowableDef d{};
    d.kind = kind;
    switch (kind) {
    case ThrowableKind::Grenade:
        d.name = "Frag Grenade";
        break;
    case ThrowableKind::Flashbang:
        d.name = "Flashbang";
        d.fuse = 2.5f;
        d.radius = 280.0f;
        d.damage = 0.0f;
        d.player_damage = 0.0f;
        d.sound_radius = 600.0f;
        break;
    case ThrowableKind::Smoke:
        d.name = "Smoke";
        d.fuse = 2.0f;
        d.radius = 110.0f;
        d.damage = 0.0f;
        d.player_damage = 0.0f;
        d.sound_radius = 150.0f;
        d.effect_duration = 8.0f;
        break;
    case ThrowableKind::Incendiary:
        d.name = "Incendiary";
        d.fuse = 1.5f;
        d.radius = 100.0f;
        d.damage = 0.0f;
        d.player_damage = 0.0f;
        d.sound_radius = 250.0f;
        d.effect_duration = 6.0f;
        break;
    }
    return d;
}

bool parse_fire_kind(const std::string& s, FireKind& out) {
    if (s == "hitscan")
        out = FireKind::Hitscan;
    else if (s == "projectile")
        out = FireKind::Projectile;
    else
        return false;
    return true;
}

bool parse_projectile_kind(const std::string& s, ProjectileKind& out) {
    if (s == "standard")
        out = ProjectileKind::Standard;
    else if (s == "explosive")
        out = ProjectileKind::Explosive;
    else if (s == "homing")
        out = ProjectileKind::Homing;
    else if (s == "proximity")
        out = ProjectileKind::Proximity;
    else
        return false;
    return true;
}

bool parse_throwable_kind(const std::string& s, ThrowableKind& out) {
    if (s == "grenade")
        out = ThrowableKind::Grenade;
    else if (s == "flashbang")
        out = ThrowableKind::Flashbang;
    else if (s == "smoke")
        out = ThrowableKind::Smoke;
    else if (s == "incendiary")
        out = ThrowableKind::Incendiary;
    else
        return false;
    return true;
}

bool parse_melee_kind(const std::string& s, MeleeKind& out) {
    if (s == "blade")
        out = MeleeKind::Blade;
    else if (s == "shield")
        out = MeleeKind::Shield;
    else
        return false;
    return true;
}

const char* throwable_kind_name(ThrowableKind k) {
    switch (k) {
    case ThrowableKind::Grenade:
        return "grenade";
    case ThrowableKind::Flashbang:
        return "flashbang";
    case ThrowableKind::Smoke:
        return "smoke";
    case ThrowableKind::Incendiary:
        return "incendiary";
    }
    return "grenade";
}
