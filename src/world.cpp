#include "world.hpp"

#include "visibility.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

void init_world(World& world, const LevelDef& level, const Loadout& loadout, const Definitions& defs,
                const RuntimeSettings& settings) {
    world = World{};
    world.settings = settings;
    world.net.local_id = settings.local_id;
    std::uint32_t seed = settings.seed ? settings.seed : std::random_device{}();
    world.rng.seed(seed);
    world.size = {std::max(1.0f, level.size.x), std::max(1.0f, level.size.y)};
    const glm::vec2 S = world.size;

    for (auto const& w : level.walls) {
        Wall wall{{w.x * S.x, w.y * S.y}, {std::max(0.0f, w.w * S.x), std::max(0.0f, w.h * S.y)}};
        world.walls.push_back(wall);
    }
    for (auto const& d : level.doors) {
        Door door{};
        door.id = d.id;
        door.hinge = {d.hinge.x * S.x, d.hinge.y * S.y};
        door.length = d.length * S.y;
        door.closed_angle = d.closed_angle;
        door.angle = d.closed_angle;
        door.max_open = std::fabs(d.max_open_angle);
        door.swing_dir = d.swing_direction < 0 ? -1 : 1;
        door.locked = d.locked;
        world.doors.push_back(door);
    }
    if (level.extraction) {
        auto const& e = *level.extraction;
        world.extraction = Wall{{e.x * S.x, e.y * S.y}, {e.w * S.x, e.h * S.y}};
    }

    world.catalog = defs.weapons;
    for (int k = 0; k < THROWABLE_KIND_COUNT; ++k)
        world.throwable_defs[static_cast<size_t>(k)] = defs.throwable_or_default(static_cast<ThrowableKind>(k));

    // Player and loadout
    Player& p = world.player;
    p.pos = {level.player_start.x * S.x, level.player_start.y * S.y};
    p.aim_point = p.pos + glm::vec2{1.0f, 0.0f};
    if (!loadout.primary.name.empty())
        p.weapons.push_back(make_weapon(defs.weapon_or_default(loadout.primary.name), loadout.primary.attachments));
    if (!loadout.secondary.name.empty())
        p.weapons.push_back(make_weapon(defs.weapon_or_default(loadout.secondary.name), loadout.secondary.attachments));
    if (p.weapons.empty())
        p.weapons.push_back(make_weapon(default_weapon_def(), {}));
    p.melee = loadout.melee;
    if (p.melee == MeleeKind::Shield)
        p.shield_durability = SHIELD_DURABILITY;
    for (size_t i = 0; i < p.throwables.size(); ++i)
        p.throwables[i] = std::max(0, loadout.throwables[i]);
    p.medkits = std::max(0, loadout.medkits);
    for (int k = 0; k < THROWABLE_KIND_COUNT; ++k) {
        if (p.throwables[static_cast<size_t>(k)] > 0) {
            p.active_throwable = static_cast<ThrowableKind>(k);
            break;
        }
    }
    resolve_unit_collisions(world, p.pos, p.radius, PLAYER_COLLISION_ITERATIONS);

    // Enemy subset: whole list, fixed count or a random count in [min, max].
    std::vector<SpawnDef> spawns = level.enemies;
    int count = static_cast<int>(spawns.size());
    if (level.enemy_count_min >= 0) {
        int lo = std::min(level.enemy_count_min, count);
        int hi = std::clamp(std::max(level.enemy_count_max, lo), lo, count);
        count = std::uniform_int_distribution<int>(lo, hi)(world.rng);
        std::shuffle(spawns.begin(), spawns.end(), world.rng);
    }
    for (int i = 0; i < count; ++i) {
        auto const& s = spawns[static_cast<size_t>(i)];
        glm::vec2 pos{s.pos.x * S.x, s.pos.y * S.y};
        auto vid = world.enemies.spawn(pos, s.direction, s.type);
        if (!vid)
            break;
        Enemy* e = world.enemies.get(*vid);
        e->view_distance = S.x * ENEMY_VIEW_FRACTION;
        resolve_unit_collisions(world, e->pos, e->radius, PLAYER_COLLISION_ITERATIONS);
        e->post = e->pos;
    }
    world.initial_enemies = world.enemies.living();

    world.segments = build_dynamic_segments(world.walls, world.doors);
    world.player_view = vision_polygon(p.pos, world.segments, far_distance(world));
    std::printf("[level] %s: %zu walls, %zu doors, %d enemies\n", level.name.c_str(), world.walls.size(),
                world.doors.size(), world.initial_enemies);
}

float far_distance(const World& world) { return std::hypot(world.size.x, world.size.y); }

float frand(World& world) { return std::uniform_real_distribution<float>(0.0f, 1.0f)(world.rng); }

Weapon* active_weapon(Player& p) {
    if (p.weapons.empty())
        return nullptr;
    p.active_weapon = std::clamp(p.active_weapon, 0, static_cast<int>(p.weapons.size()) - 1);
    return &p.weapons[static_cast<size_t>(p.active_weapon)];
}

const ThrowableDef& throwable_def(const World& world, ThrowableKind kind) {
    return world.throwable_defs[static_cast<size_t>(kind)];
}

void emit_sound(World& world, glm::vec2 pos, float max_radius, float lifetime, SoundType type) {
    SoundEvent s{};
    s.pos = pos;
    s.max_radius = max_radius;
    s.lifetime = lifetime;
    s.max_lifetime = lifetime;
    s.type = type;
    s.id = ++world.sound_serial;
    world.sounds.push_back(s);
}

void add_light(World& world, glm::vec2 pos, float radius, float power, float ttl, LightKind kind) {
    world.fx.lights.push_back(Light{pos, radius, power, ttl, ttl, kind});
}

void spawn_sparks(World& world, glm::vec2 pos, int count) {
    for (int i = 0; i < count; ++i) {
        float a = frand(world) * 2.0f * PI;
        float sp = 60.0f + frand(world) * 180.0f;
        world.fx.sparks.push_back(Spark{pos, dir_from_angle(a) * sp, SPARK_TTL * (0.5f + frand(world))});
    }
}

bool circle_blocked(const World& world, glm::vec2 c, float r) {
    for (auto const& w : world.walls)
        if (circle_overlaps_wall(c, r, w))
            return true;
    for (auto const& d : world.doors)
        if (circle_overlaps_capsule(c, r, d.hinge, door_end(d), d.thickness * 0.5f))
            return true;
    return false;
}

void resolve_unit_collisions(const World& world, glm::vec2& pos, float r, int iterations) {
    for (int it = 0; it < iterations; ++it) {
        bool moved = false;
        for (auto const& w : world.walls)
            moved |= resolve_circle_wall(pos, r, w);
        for (auto const& d : world.doors)
            moved |= resolve_circle_capsule(pos, r, d.hinge, door_end(d), d.thickness * 0.5f);
        if (!moved)
            break;
    }
    pos.x = std::clamp(pos.x, r, world.size.x - r);
    pos.y = std::clamp(pos.y, r, world.size.y - r);
}
