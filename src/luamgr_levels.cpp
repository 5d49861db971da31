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

void LuaManager::add_level(const LevelDef& d) {
    for (auto& l : defs_.levels) {
        if (l.name == d.name) {
            l = d;
            return;
        }
    }
    defs_.levels.push_back(d);
}

static glm::vec2 get_point(sol::table t, const char* key, glm::vec2 def) {
    sol::object o = t.get<sol::object>(key);
    if (!o.is<sol::table>())
        return def;
    sol::table p = o;
    return {p.get_or("x", def.x), p.get_or("y", def.y)};
}

static WallDef parse_rect(sol::table t) {
    WallDef w{};
    w.x = t.get_or("x", 0.0f);
    w.y = t.get_or("y", 0.0f);
    w.w = std::max(0.0f, t.get_or("w", 0.0f));
    w.h = std::max(0.0f, t.get_or("h", 0.0f));
    return w;
}

template <class Fn> static void each_table(sol::table parent, const char* key, Fn&& fn) {
    sol::object o = parent.get<sol::object>(key);
    if (!o.is<sol::table>())
        return;
    sol::table arr = o;
    for (auto& kv : arr) {
        sol::object v = kv.second;
        if (v.is<sol::table>())
            fn(v.as<sol::table>());
    }
}

void LuaManager::register_level_api() {
    sol::state& s = *S;
    s.set_function("register_level", [this](sol::table t) {
        LevelDef d{};
        d.name = t.get_or("name", std::string{});
        if (d.name.empty()) {
            std::fprintf(stderr, "[lua] register_level: missing name, skipped\n");
            return;
        }
        d.description = t.get_or("description", std::string{});
        d.size.x = std::max(1.0f, t.get_or("width", WORLD_WIDTH));
        d.size.y = std::max(1.0f, t.get_or("height", WORLD_HEIGHT));
        d.player_start = get_point(t, "player_start", d.player_start);
        each_table(t, "walls", [&](sol::table w) { d.walls.push_back(parse_rect(w)); });
        each_table(t, "doors", [&](sol::table o) {
            DoorDef door{};
            door.id = o.get_or("id", static_cast<int>(d.doors.size()) + 1);
            door.hinge = get_point(o, "hinge", door.hinge);
            door.length = std::max(0.0f, o.get_or("length", door.length));
            door.closed_angle = o.get_or("closed_angle", 0.0f);
            door.max_open_angle = o.get_or("max_open_angle", door.max_open_angle);
            door.swing_direction = o.get_or("swing_direction", 1) < 0 ? -1 : 1;
            door.locked = o.get_or("locked", false);
            d.doors.push_back(door);
        });
        each_table(t, "enemies", [&](sol::table o) {
            SpawnDef sp{};
            sp.pos = {o.get_or("x", 0.5f), o.get_or("y", 0.5f)};
            sp.direction = o.get_or("direction", 0.0f);
            std::string type = o.get_or("type", std::string("standard"));
            sp.type = type == "advanced" ? EnemyType::Advanced : EnemyType::Standard;
            d.enemies.push_back(sp);
        });
        if (sol::optional<int> n = t.get<sol::optional<int>>("enemy_count")) {
            d.enemy_count_min = d.enemy_count_max = std::max(0, *n);
        } else {
            int lo = t.get_or("enemy_count_min", -1);
            int hi = t.get_or("enemy_count_max", lo);
            if (lo >= 0) {
                d.enemy_count_min = lo;
                d.enemy_count_max = std::max(lo, hi);
            }
        }
        sol::object ex = t.get<sol::object>("extraction");
        if (ex.is<sol::table>())
            d.extraction = parse_rect(ex.as<sol::table>());
        add_level(d);
    });
}
