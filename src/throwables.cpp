#include "throwables.hpp"

#include "combat.hpp"
#include "world.hpp"

#include <algorithm>
#include <cmath>

bool throw_throwable(World& world, ThrowableKind kind, glm::vec2 from, glm::vec2 target, float fuse_left) {
    auto v = world.throwables.alloc();
    if (!v)
        return false;
    Throwable* t = world.throwables.get(*v);
    glm::vec2 to = target - from;
    float power = std::min(glm::length(to) / THROW_POWER_DIVISOR, THROW_POWER_MAX);
    t->kind = kind;
    t->pos = from;
    t->vel = safe_normalize(to) * power;
    t->fuse = fuse_left;
    return true;
}

void detonate_throwable(World& world, ThrowableKind kind, glm::vec2 pos) {
    const ThrowableDef& d = throwable_def(world, kind);
    switch (kind) {
    case ThrowableKind::Grenade:
        blast(world, pos, d.radius, d.damage, d.player_damage, true);
        emit_sound(world, pos, d.sound_radius, 1.0f, SoundType::Explosion);
        spawn_sparks(world, pos, 24);
        break;
    case ThrowableKind::Flashbang:
        flash(world, pos, d.radius);
        emit_sound(world, pos, d.sound_radius, 1.0f, SoundType::Explosion);
        break;
    case ThrowableKind::Smoke:
        world.smoke.push_back(SmokeCloud{pos, d.radius, d.effect_duration});
        emit_sound(world, pos, d.sound_radius, 0.5f, SoundType::Bounce);
        break;
    case ThrowableKind::Incendiary:
        world.fires.push_back(FireZone{pos, d.radius, d.effect_duration});
        add_light(world, pos, d.radius, 1.5f, d.effect_duration, LightKind::Explosion);
        emit_sound(world, pos, d.sound_radius, 0.6f, SoundType::Explosion);
        break;
    }
}

static bool blocked_at(const World& world, glm::vec2 p) {
    return circle_blocked(world, p, THROWABLE_RADIUS);
}

void sim_throwables(World& world, float dt) {
    for (auto& t : world.throwables.data()) {
        if (!t.active)
            continue;
        t.fuse -= dt;
        if (t.fuse <= 0.0f) {
            ThrowableKind kind = t.kind;
            glm::vec2 pos = t.pos;
            world.throwables.release(t.vid);
            detonate_throwable(world, kind, pos);
            continue;
        }
        t.vel *= std::max(0.0f, 1.0f - dt * THROW_DAMPING);
        glm::vec2 delta = t.vel * dt * 60.0f;
        bool bounced = false;
        // Axis-separated so a corner flips both components.
        glm::vec2 next = t.pos;
        next.x += delta.x;
        if (blocked_at(world, next)) {
            next.x = t.pos.x;
            t.vel.x *= -THROW_BOUNCE;
            bounced = true;
        }
        next.y += delta.y;
        if (blocked_at(world, next)) {
            next.y = t.pos.y;
            t.vel.y *= -THROW_BOUNCE;
            bounced = true;
        }
        t.pos = next;
        if (bounced && !t.bounced) {
            t.bounced = true;
            emit_sound(world, t.pos, BOUNCE_SOUND_RADIUS, 0.3f, SoundType::Bounce);
        }
    }
}
