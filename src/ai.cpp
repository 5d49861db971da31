#include "ai.hpp"

#include "combat.hpp"
#include "doors.hpp"
#include "visibility.hpp"
#include "world.hpp"

#include <algorithm>
#include <cmath>
#include <variant>

bool smoke_blocks(const World& world, glm::vec2 a, glm::vec2 b) {
    for (auto const& c : world.smoke) {
        if (segment_circle(a, b, c.pos, c.radius))
            return true;
    }
    return false;
}

bool enemy_can_see(const World& world, const Enemy& e, glm::vec2 point, bool use_fov) {
    glm::vec2 to = point - e.pos;
    float d = glm::length(to);
    if (d > e.view_distance)
        return false;
    if (use_fov && d > 1e-3f) {
        if (std::fabs(wrap_angle(angle_of(to) - e.facing)) > e.fov * 0.5f)
            return false;
    }
    if (!line_of_sight(e.pos, point, world.segments))
        return false;
    return !smoke_blocks(world, e.pos, point);
}

bool player_camping_door(const World& world, const Door& d, const Enemy& e) {
    const Player& p = world.player;
    glm::vec2 dv = dir_from_angle(d.closed_angle);
    glm::vec2 ae = e.pos - d.hinge;
    glm::vec2 ap = p.pos - d.hinge;
    float side_e = dv.x * ae.y - dv.y * ae.x;
    float side_p = dv.x * ap.y - dv.y * ap.x;
    if (side_e * side_p >= 0.0f)
        return false;
    float dist = distance_to_segment(p.pos, d.hinge, door_end(d, d.closed_angle));
    return dist < p.radius + d.thickness * 0.5f + DOOR_CAMP_MARGIN;
}

namespace {

bool heard_by_enemies(SoundType t) {
    return t != SoundType::EnemyMove && t != SoundType::EnemyShoot && t != SoundType::Alert;
}

void open_blocking_doors(World& world, Enemy& e, glm::vec2 next) {
    for (auto& d : world.doors) {
        if (d.locked || !door_is_closed(d))
            continue;
        if (!circle_overlaps_capsule(next, e.radius + ENEMY_DOOR_PROBE, d.hinge, door_end(d), d.thickness * 0.5f))
            continue;
        if (!player_camping_door(world, d, e))
            door_auto_open(d);
    }
}

// Returns true when the enemy is within arrival distance of `dest`.
bool move_toward(World& world, Enemy& e, glm::vec2 dest, float speed, float dt) {
    glm::vec2 to = dest - e.pos;
    float d = glm::length(to);
    if (d < e.radius * ENEMY_ARRIVE_SCALE)
        return true;
    if (e.suppress_timer > 0.0f)
        return false;
    glm::vec2 dir = to / d;
    e.facing = angle_of(dir);
    glm::vec2 next = e.pos + dir * std::min(d, speed * dt);
    open_blocking_doors(world, e, next);
    resolve_unit_collisions(world, next, e.radius, PLAYER_COLLISION_ITERATIONS);
    e.pos = next;
    if (e.step_sound_timer <= 0.0f) {
        emit_sound(world, e.pos, ENEMY_STEP_SOUND_RADIUS, 0.4f, SoundType::EnemyMove);
        e.step_sound_timer = ENEMY_STEP_SOUND_INTERVAL;
    }
    return false;
}

void enemy_fire_bullet(World& world, Enemy& e) {
    glm::vec2 dir = dir_from_angle(e.facing);
    spawn_bullet(world, e.pos + dir * (e.radius + ENEMY_BULLET_RADIUS + 1.0f), dir, ENEMY_BULLET_SPEED,
                 ENEMY_BULLET_RADIUS, ENEMY_BULLET_DAMAGE, Owner::Enemy);
    emit_sound(world, e.pos, ENEMY_SHOOT_SOUND_RADIUS, SHOOT_SOUND_LIFETIME, SoundType::EnemyShoot);
    add_light(world, e.pos + dir * e.radius, 50.0f, 1.0f, MUZZLE_LIGHT_TTL, LightKind::Muzzle);
}

void axe_strike(World& world, Enemy& e) {
    Player& p = world.player;
    glm::vec2 to = p.pos - e.pos;
    if (glm::length(to) > AXE_RANGE + p.radius)
        return;
    if (std::fabs(wrap_angle(angle_of(to) - e.facing)) > AXE_ARC_DEG * PI / 360.0f)
        return;
    if (!line_of_sight(e.pos, p.pos, world.segments))
        return;
    float front = std::fabs(wrap_angle(angle_of(e.pos - p.pos) - p.aim));
    if (shield_raised(p) && front <= SHIELD_FRONT_ARC_DEG * PI / 360.0f) {
        p.shield_durability = std::max(0.0f, p.shield_durability - AXE_SHIELD_DAMAGE);
        emit_sound(world, p.pos, BLOCKED_SLASH_SOUND_RADIUS, 0.3f, SoundType::Impact);
        return;
    }
    p.health = 0.0f;
    p.hit_timer = PLAYER_HIT_FLASH_SECONDS;
    world.game_over = true;
    world.fx.hits.push_back(HitMarker{p.pos});
}

void advanced_attack(World& world, Enemy& e, AdvancedKit& k, float dt) {
    const Player& p = world.player;
    switch (k.axe) {
    case AxePhase::Idle:
        if (glm::length(p.pos - e.pos) <= AXE_RANGE + p.radius) {
            k.axe = AxePhase::Windup;
            k.axe_timer = AXE_WINDUP;
            return;
        }
        break;
    case AxePhase::Windup:
        k.axe_timer -= dt;
        if (k.axe_timer <= 0.0f) {
            k.axe = AxePhase::Swing;
            k.axe_timer = AXE_SWING;
            emit_sound(world, e.pos, SLASH_SOUND_RADIUS, 0.3f, SoundType::Slash);
            axe_strike(world, e);
        }
        return;
    case AxePhase::Swing:
        k.axe_timer -= dt;
        if (k.axe_timer <= 0.0f) {
            k.axe = AxePhase::Recover;
            k.axe_timer = AXE_RECOVER;
        }
        return;
    case AxePhase::Recover:
        k.axe_timer -= dt;
        if (k.axe_timer <= 0.0f)
            k.axe = AxePhase::Idle;
        return;
    }

    // Rifle: bursts with their own magazine.
    if (k.reloading) {
        k.reload_timer -= dt;
        if (k.reload_timer <= 0.0f) {
            k.reloading = false;
            k.rifle_ammo = RIFLE_MAG;
            k.burst_left = RIFLE_BURST;
        }
        return;
    }
    if (k.rifle_ammo <= 0) {
        k.reloading = true;
        k.reload_timer = RIFLE_RELOAD_SECONDS;
        return;
    }
    if (k.burst_pause > 0.0f) {
        k.burst_pause -= dt;
        return;
    }
    k.shot_timer -= dt;
    if (k.shot_timer > 0.0f)
        return;
    float jitter = (frand(world) - 0.5f) * 0.06f;
    hitscan_pellet(world, e.pos, e.facing + jitter, RIFLE_DAMAGE, Owner::Enemy, false);
    emit_sound(world, e.pos, ENEMY_SHOOT_SOUND_RADIUS, SHOOT_SOUND_LIFETIME, SoundType::EnemyShoot);
    add_light(world, e.pos + dir_from_angle(e.facing) * e.radius, 50.0f, 1.0f, MUZZLE_LIGHT_TTL, LightKind::Muzzle);
    k.rifle_ammo = std::max(0, k.rifle_ammo - 1);
    k.shot_timer = RIFLE_SHOT_INTERVAL;
    if (--k.burst_left <= 0) {
        k.burst_left = RIFLE_BURST;
        k.burst_pause = RIFLE_BURST_PAUSE;
    }
}

void attack(World& world, Enemy& e, float dt) {
    if (auto* k = std::get_if<AdvancedKit>(&e.kit)) {
        advanced_attack(world, e, *k, dt);
        return;
    }
    auto& k = std::get<StandardKit>(e.kit);
    if (e.shoot_cooldown <= 0.0f) {
        enemy_fire_bullet(world, e);
        e.shoot_cooldown = k.shoot_cooldown_max;
    }
}

void reset_attack(Enemy& e) {
    if (auto* k = std::get_if<AdvancedKit>(&e.kit)) {
        k->axe = AxePhase::Idle;
        k->axe_timer = 0.0f;
    }
}

void become_alert(World& world, Enemy& e) {
    e.alert = true;
    e.state = AiState::Alert;
    e.reaction_timer = world.settings.reaction_delay;
    emit_sound(world, e.pos, ALERT_SOUND_RADIUS, 0.5f, SoundType::Alert);
}

void track_player(World& world, Enemy& e) {
    e.target = world.player.pos;
    e.last_seen = world.now;
    e.facing = angle_of(world.player.pos - e.pos);
}

void start_search(Enemy& e, float seconds) {
    e.state = AiState::Searching;
    e.search_timer = seconds;
    e.search_base_facing = e.facing;
}

void tactical_step(World& world, Enemy& e, float dt) {
    bool sees = world.player.health > 0.0f && enemy_can_see(world, e, world.player.pos, true);
    if (sees) {
        if (!e.alert)
            become_alert(world, e);
        track_player(world, e);
        if (e.reaction_timer <= 0.0f)
            attack(world, e, dt);
        return;
    }
    if (e.alert) {
        e.alert = false;
        reset_attack(e);
        start_search(e, ENEMY_SEARCH_SECONDS);
        return;
    }

    for (auto const& s : world.sounds) {
        if (!heard_by_enemies(s.type) || s.radius <= 0.0f)
            continue;
        float d = glm::length(s.pos - e.pos);
        if (s.type == SoundType::PlayerShoot && d <= s.radius + ENEMY_SUPPRESS_MARGIN)
            e.suppress_timer = ENEMY_SUPPRESS_SECONDS;
        // A sound is acted on once; only newer ones re-route the enemy.
        if (d <= s.radius && s.id > e.heard_sound) {
            e.state = AiState::Investigating;
            e.target = s.pos;
            e.heard_sound = s.id;
        }
    }

    switch (e.state) {
    case AiState::Idle:
    case AiState::Alert:
        e.state = AiState::Idle;
        break;
    case AiState::Investigating:
        if (!e.target) {
            start_search(e, ENEMY_FOLLOWUP_SEARCH_SECONDS);
            break;
        }
        if (move_toward(world, e, *e.target, e.speed * ENEMY_INVESTIGATE_SPEED_SCALE, dt)) {
            e.target.reset();
            start_search(e, ENEMY_FOLLOWUP_SEARCH_SECONDS);
        }
        break;
    case AiState::Searching: {
        e.search_timer -= dt;
        float ms = static_cast<float>(world.now * 1000.0);
        e.facing = e.search_base_facing + std::sin(ms / ENEMY_LOOK_AROUND_PERIOD) * PI / 3.0f;
        if (e.search_timer <= 0.0f)
            e.state = AiState::Returning;
        break;
    }
    case AiState::Returning:
        if (move_toward(world, e, e.post, e.speed, dt)) {
            e.facing = e.post_facing;
            e.state = AiState::Idle;
        }
        break;
    }
}

void aggressive_step(World& world, Enemy& e, float dt) {
    bool sees = world.player.health > 0.0f && enemy_can_see(world, e, world.player.pos, false);
    if (!sees) {
        if (e.alert)
            reset_attack(e);
        e.alert = false;
        e.state = AiState::Idle;
        return;
    }
    e.alert = true;
    e.state = AiState::Alert;
    track_player(world, e);
    attack(world, e, dt);
}

} // namespace

void sim_enemies(World& world, float dt) {
    for (auto& e : world.enemies.data()) {
        if (!e.active || e.health <= 0.0f)
            continue;
        e.shoot_cooldown = std::max(0.0f, e.shoot_cooldown - dt);
        e.suppress_timer = std::max(0.0f, e.suppress_timer - dt);
        e.reaction_timer = std::max(0.0f, e.reaction_timer - dt);
        e.step_sound_timer = std::max(0.0f, e.step_sound_timer - dt);
        if (e.stun_timer > 0.0f) {
            e.stun_timer = std::max(0.0f, e.stun_timer - dt);
            continue;
        }
        switch (world.settings.ai_behavior) {
        case AiBehavior::Tactical:
            tactical_step(world, e, dt);
            break;
        case AiBehavior::Aggressive:
            aggressive_step(world, e, dt);
            break;
        }
    }
    for (auto& e : world.enemies.data()) {
        if (e.active && e.health <= 0.0f)
            world.enemies.release(e.vid);
    }
}
