#include "luamgr.hpp"

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <sol/sol.hpp>
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <algorithm>
#include <cstdio>

void LuaManager::add_weapon(const WeaponDef& d) {
    for (auto& w : defs_.weapons) {
        if (w.name == d.name) {
            w = d;
            return;
        }
    }
    defs_.weapons.push_back(d);
}

void LuaManager::add_throwable(const ThrowableDef& d) {
    for (auto& t : defs_.throwables) {
        if (t.kind == d.kind) {
            t = d;
            return;
        }
    }
    defs_.throwables.push_back(d);
}

static AttachmentDef parse_attachment(sol::table t) {
    AttachmentDef a{};
    a.slot = t.get_or("slot", std::string{});
    a.name = t.get_or("name", std::string{});
    a.fire_rate = t.get_or("fire_rate", 1.0f);
    a.reload_time = t.get_or("reload_time", 1.0f);
    a.bullet_radius = t.get_or("bullet_radius", 0.0f);
    a.pellets = t.get_or("pellets", 0);
    a.mag_size = t.get_or("mag_size", 1.0f);
    a.spread = t.get_or("spread", 1.0f);
    a.sound_radius = t.get_or("sound_radius", 1.0f);
    a.incendiary = t.get_or("incendiary", false);
    return a;
}

void LuaManager::register_weapon_api() {
    sol::state& s = *S;
    s.set_function("register_weapon", [this](sol::table t) {
        WeaponDef d{};
        d.name = t.get_or("name", std::string{});
        if (d.name.empty()) {
            std::fprintf(stderr, "[lua] register_weapon: missing name, skipped\n");
            return;
        }
        d.category = t.get_or("category", std::string("primary"));
        std::string fire = t.get_or("fire", std::string("projectile"));
        if (!parse_fire_kind(fire, d.fire))
            std::fprintf(stderr, "[lua] %s: unknown fire '%s'\n", d.name.c_str(), fire.c_str());
        std::string proj = t.get_or("projectile", std::string("standard"));
        if (!parse_projectile_kind(proj, d.projectile))
            std::fprintf(stderr, "[lua] %s: unknown projectile '%s'\n", d.name.c_str(), proj.c_str());
        d.damage = std::max(0.0f, t.get_or("damage", d.damage));
        d.fire_rate = std::max(0.01f, t.get_or("fire_rate", d.fire_rate));
        d.automatic = t.get_or("automatic", false);
        d.bullet_speed = std::max(1.0f, t.get_or("bullet_speed", d.bullet_speed));
        d.bullet_radius = std::max(0.5f, t.get_or("bullet_radius", d.bullet_radius));
        d.pellets = std::max(1, t.get_or("pellets", 1));
        d.spread = std::max(0.0f, t.get_or("spread", d.spread));
        d.pellet_spread = std::max(0.0f, t.get_or("pellet_spread", 0.0f));
        d.mag_size = t.get_or("mag_size", d.mag_size);
        d.reserve = std::max(0, t.get_or("reserve", d.reserve));
        d.reload_time = std::max(0.0f, t.get_or("reload_time", d.reload_time));
        d.sound_radius = std::max(0.0f, t.get_or("sound_radius", d.sound_radius));
        d.incendiary = t.get_or("incendiary", false);
        d.blast_radius = std::max(0.0f, t.get_or("blast_radius", 0.0f));
        d.blast_damage = std::max(0.0f, t.get_or("blast_damage", 0.0f));
        d.proximity_radius = std::max(0.0f, t.get_or("proximity_radius", 0.0f));
        d.min_range = std::max(0.0f, t.get_or("min_range", 0.0f));
        d.max_range = std::max(d.min_range, t.get_or("max_range", 0.0f));
        d.charge_time = std::max(0.0f, t.get_or("charge_time", 0.0f));
        d.lifetime = std::max(0.0f, t.get_or("lifetime", 0.0f));
        sol::object list = t.get<sol::object>("attachments");
        if (list.is<sol::table>()) {
            sol::table arr = list;
            for (auto& kv : arr) {
                sol::object v = kv.second;
                if (!v.is<sol::table>())
                    continue;
                AttachmentDef a = parse_attachment(v.as<sol::table>());
                if (!a.name.empty())
                    d.attachments.push_back(a);
            }
        }
        add_weapon(d);
    });
    s.set_function("register_throwable", [this](sol::table t) {
        std::string kind = t.get_or("kind", std::string{});
        ThrowableKind k{};
        if (!parse_throwable_kind(kind, k)) {
            std::fprintf(stderr, "[lua] register_throwable: unknown kind '%s', skipped\n", kind.c_str());
            return;
        }
        ThrowableDef d = default_throwable_def(k);
        d.name = t.get_or("name", d.name);
        d.fuse = std::max(0.05f, t.get_or("fuse", d.fuse));
        d.radius = std::max(0.0f, t.get_or("radius", d.radius));
        d.damage = std::max(0.0f, t.get_or("damage", d.damage));
        d.player_damage = std::max(0.0f, t.get_or("player_damage", d.player_damage));
        d.sound_radius = std::max(0.0f, t.get_or("sound_radius", d.sound_radius));
        d.effect_duration = std::max(0.0f, t.get_or("effect_duration", d.effect_duration));
        add_throwable(d);
    });
}
