#include "sim.hpp"

#include "ai.hpp"
#include "combat.hpp"
#include "doors.hpp"
#include "net.hpp"
#include "throwables.hpp"
#include "visibility.hpp"
#include "world.hpp"

#include <algorithm>

template <class T, class Fn> static void age_out(std::vector<T>& v, float dt, Fn&& each) {
    for (auto& x : v) {
        x.ttl -= dt;
        each(x);
    }
    v.erase(std::remove_if(v.begin(), v.end(), [](const T& x) { return x.ttl <= 0.0f; }), v.end());
}

template <class T> static void age_out(std::vector<T>& v, float dt) {
    age_out(v, dt, [](T&) {});
}

bool sim_tick(World& world, const PlayerCommands& cmd, float frame_dt) {
    if (world.paused || world.game_over || world.mission_complete)
        return false;
    float dt = std::min(frame_dt, world.settings.max_frame_dt);
    if (!(dt > 0.0f))
        return false;
    world.now += static_cast<double>(dt);
    ++world.frame;

    world.segments = build_dynamic_segments(world.walls, world.doors);
    ++world.segment_rebuilds;

    sim_doors(world, dt);
    sim_player(world, cmd, dt);
    sim_bullets(world, dt);
    sim_throwables(world, dt);
    sim_melee(world, dt);
    sim_enemies(world, dt);
    sim_effects(world, dt);
    update_mission(world);

    world.player_view = vision_polygon(world.player.pos, world.segments, far_distance(world));
    return true;
}

void sim_effects(World& world, float dt) {
    Effects& fx = world.fx;
    age_out(fx.lights, dt);
    age_out(fx.sparks, dt, [dt](Spark& s) {
        s.pos += s.vel * dt;
        s.vel *= std::max(0.0f, 1.0f - dt * 4.0f);
    });
    age_out(fx.tracers, dt);
    age_out(fx.hits, dt);
    age_out(fx.rings, dt);
    age_out(world.smoke, dt);

    for (auto& s : world.sounds) {
        s.lifetime -= dt;
        float k = s.max_lifetime > 0.0f ? 1.0f - std::max(0.0f, s.lifetime) / s.max_lifetime : 1.0f;
        s.radius = s.max_radius * k;
    }
    world.sounds.erase(std::remove_if(world.sounds.begin(), world.sounds.end(),
                                      [](const SoundEvent& s) { return s.lifetime <= 0.0f; }),
                       world.sounds.end());

    Player& p = world.player;
    for (auto const& f : world.fires) {
        if (p.health > 0.0f && glm::length(p.pos - f.pos) < f.radius + p.radius)
            apply_burn(p.status);
        for (auto& e : world.enemies.data()) {
            if (e.active && e.health > 0.0f && glm::length(e.pos - f.pos) < f.radius + e.radius)
                apply_burn(e.status);
        }
    }
    age_out(world.fires, dt);

    if (p.health > 0.0f) {
        float dot = tick_status(p.status, dt);
        if (dot > 0.0f) {
            p.health = std::max(0.0f, p.health - dot);
            p.healing = false;
            p.heal_timer = 0.0f;
        }
    }
    p.hit_timer = std::max(0.0f, p.hit_timer - dt);
    p.flash_timer = std::max(0.0f, p.flash_timer - dt);
    for (auto& e : world.enemies.data()) {
        if (e.active && e.health > 0.0f)
            damage_enemy(e, tick_status(e.status, dt));
    }

    sim_remote_peers(world, dt);
    net_tick(world, dt);
}

void update_mission(World& world) {
    if (world.player.health <= 0.0f) {
        world.game_over = true;
        return;
    }
    if (world.enemies.living() > 0)
        return;
    if (world.extraction) {
        world.extraction_active = true;
        if (point_in_wall(world.player.pos, *world.extraction))
            world.mission_complete = true;
    } else if (world.initial_enemies > 0) {
        world.mission_complete = true;
    }
}
