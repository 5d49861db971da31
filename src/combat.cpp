#include "combat.hpp"

#include "net.hpp"
#include "visibility.hpp"
#include "world.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace {

// Something a shot can hit this tick.
struct Target {
    glm::vec2 pos{0.0f, 0.0f};
    float radius{0.0f};
    std::optional<VID> enemy{};
    int peer{-1};
    bool player{false};
};

std::vector<Target> gather_targets(World& world, Owner owner) {
    std::vector<Target> out;
    if (owner == Owner::Player) {
        for (auto const& e : world.enemies.data()) {
            if (!e.active || e.health <= 0.0f)
                continue;
            Target t{};
            t.pos = e.pos;
            t.radius = e.radius;
            t.enemy = e.vid;
            out.push_back(t);
        }
        for (size_t i = 0; i < world.net.peers.size(); ++i) {
            auto const& p = world.net.peers[i];
            if (p.health <= 0.0f)
                continue;
            Target t{};
            t.pos = p.pos;
            t.radius = p.radius;
            t.peer = static_cast<int>(i);
            out.push_back(t);
        }
    } else if (world.player.health > 0.0f) {
        Target t{};
        t.pos = world.player.pos;
        t.radius = world.player.radius;
        t.player = true;
        out.push_back(t);
    }
    return out;
}

void hit_target(World& world, const Target& t, float damage, glm::vec2 source, bool incendiary) {
    if (t.enemy) {
        if (Enemy* e = world.enemies.get(*t.enemy)) {
            damage_enemy(*e, damage);
            if (incendiary)
                apply_burn(e->status);
        }
    } else if (t.peer >= 0) {
        // Remote health is not ours to change.
        NetMessage m{};
        m.type = NetMessageType::PlayerHit;
        m.target = world.net.peers[static_cast<size_t>(t.peer)].id;
        m.damage = damage;
        m.pos = t.pos;
        net_emit(world, m);
    } else if (t.player) {
        damage_player(world, damage, source);
        if (incendiary)
            apply_burn(world.player.status);
    }
    world.fx.hits.push_back(HitMarker{t.pos});
    emit_sound(world, t.pos, FLESH_SOUND_RADIUS, FLESH_SOUND_LIFETIME, SoundType::Impact);
}

void wall_impact(World& world, glm::vec2 at) {
    add_light(world, at, 40.0f, IMPACT_LIGHT_POWER, IMPACT_LIGHT_TTL, LightKind::Impact);
    emit_sound(world, at, IMPACT_SOUND_RADIUS, IMPACT_SOUND_LIFETIME, SoundType::Impact);
    spawn_sparks(world, at, 10 + static_cast<int>(frand(world) * 6.0f));
}

std::optional<RayHit> nearest_segment_hit(const World& world, glm::vec2 p0, glm::vec2 p1) {
    std::optional<RayHit> best;
    for (auto const& s : world.segments) {
        if (auto h = segment_segment(p0, p1, s)) {
            if (!best || h->t < best->t)
                best = h;
        }
    }
    return best;
}

void explosion_fx(World& world, glm::vec2 at, float radius, float sound_radius) {
    world.fx.rings.push_back(ExplosionRing{at, radius});
    add_light(world, at, radius, 2.0f, 0.3f, LightKind::Explosion);
    emit_sound(world, at, sound_radius, 1.0f, SoundType::Explosion);
}

// Shared by wall hits, target hits and proximity triggers.
void detonate_bullet(World& world, Bullet& b, glm::vec2 at, const Target* direct) {
    if (b.blast_radius > 0.0f) {
        float player_dmg = b.owner == Owner::Enemy ? b.blast_damage : 0.0f;
        float enemy_dmg = b.owner == Owner::Player ? b.blast_damage : 0.0f;
        blast(world, at, b.blast_radius, enemy_dmg, player_dmg, false);
        emit_sound(world, at, PROJECTILE_BLAST_SOUND_RADIUS, 1.0f, SoundType::Explosion);
    } else if (direct) {
        hit_target(world, *direct, b.damage, b.pos, b.incendiary);
    }
}

void steer_homing(World& world, Bullet& b, float dt) {
    if (!b.homing_locked) {
        float best = 0.0f;
        std::optional<VID> pick;
        float remaining = std::max(0.0f, b.max_range - b.travelled);
        for (auto const& e : world.enemies.data()) {
            if (!e.active || e.health <= 0.0f)
                continue;
            glm::vec2 to = e.pos - b.pos;
            float along = glm::dot(to, b.dir);
            if (along <= 0.0f || (b.max_range > 0.0f && along > remaining + e.radius))
                continue;
            float perp = std::fabs(b.dir.x * to.y - b.dir.y * to.x);
            if (perp > HOMING_ACQUIRE_RADIUS + e.radius)
                continue;
            float d = glm::length(to);
            if (!pick || d < best) {
                best = d;
                pick = e.vid;
            }
        }
        if (!pick)
            return;
        b.homing_target = pick;
        b.homing_locked = true;
    }
    if (!b.homing_target)
        return;
    const Enemy* t = world.enemies.get(*b.homing_target);
    if (!t || t->health <= 0.0f) {
        b.homing_target.reset();
        return;
    }
    float heading = angle_of(b.dir);
    float err = wrap_angle(angle_of(t->pos - b.pos) - heading);
    if (std::fabs(err) <= HOMING_RELEASE_ERROR)
        return;
    float turn = std::min(std::fabs(err), HOMING_TURN_RATE * dt);
    b.dir = dir_from_angle(heading + (err > 0.0f ? turn : -turn));
}

} // namespace

bool shield_raised(const Player& p) {
    return p.melee == MeleeKind::Shield && p.mode == CombatMode::Melee && p.shield_durability > 0.0f;
}

float shield_absorb(Player& p, float amount, glm::vec2 source) {
    if (p.melee != MeleeKind::Shield || p.shield_durability <= 0.0f || amount <= 0.0f)
        return amount;
    float diff = std::fabs(wrap_angle(angle_of(source - p.pos) - p.aim));
    float half_front = SHIELD_FRONT_ARC_DEG * PI / 360.0f;
    float absorbable = 0.0f;
    if (shield_raised(p) && diff <= half_front)
        absorbable = amount;
    else if (diff >= PI - half_front)
        absorbable = amount * (1.0f - SHIELD_REAR_PASS_THROUGH);
    float taken = std::min(absorbable, p.shield_durability);
    p.shield_durability = std::max(0.0f, p.shield_durability - taken);
    return amount - taken;
}

void damage_enemy(Enemy& e, float amount) {
    if (amount <= 0.0f || e.health <= 0.0f)
        return;
    e.health = std::max(0.0f, e.health - amount);
}

void damage_player(World& world, float amount, glm::vec2 source) {
    Player& p = world.player;
    if (amount <= 0.0f || p.health <= 0.0f)
        return;
    float dmg = shield_absorb(p, amount, source);
    if (dmg <= 0.0f)
        return;
    p.health = std::max(0.0f, p.health - dmg);
    p.hit_timer = PLAYER_HIT_FLASH_SECONDS;
    p.healing = false;
    p.heal_timer = 0.0f;
    if (p.health <= 0.0f)
        world.game_over = true;
}

void hitscan_pellet(World& world, glm::vec2 origin, float angle, float damage, Owner owner, bool incendiary) {
    glm::vec2 dir = dir_from_angle(angle);
    float nearest = HITSCAN_MAX_DISTANCE;
    for (auto const& s : world.segments) {
        if (auto h = ray_segment(origin, dir, s)) {
            if (h->t < nearest)
                nearest = h->t;
        }
    }
    std::vector<Target> targets = gather_targets(world, owner);
    const Target* hit = nullptr;
    float hit_t = nearest;
    for (auto const& t : targets) {
        glm::vec2 to = t.pos - origin;
        float along = glm::dot(to, dir);
        if (along <= 0.0f || along >= hit_t)
            continue;
        float perp = std::fabs(dir.x * to.y - dir.y * to.x);
        if (perp < t.radius) {
            hit = &t;
            hit_t = along;
        }
    }
    glm::vec2 end = origin + dir * hit_t;
    world.fx.tracers.push_back(Tracer{origin, end});
    if (hit)
        hit_target(world, *hit, damage, origin, incendiary);
    else
        wall_impact(world, end);
}

Bullet* spawn_bullet(World& world, glm::vec2 pos, glm::vec2 dir, float speed, float radius, float damage,
                     Owner owner) {
    auto v = world.bullets.alloc();
    if (!v)
        return nullptr;
    Bullet* b = world.bullets.get(*v);
    b->pos = pos;
    b->dir = safe_normalize(dir);
    b->speed = speed;
    b->radius = radius;
    b->damage = damage;
    b->owner = owner;
    return b;
}

bool fire_weapon(World& world, Weapon& w, float charge) {
    Player& p = world.player;
    if (w.cooldown > 0.0f || w.reloading)
        return false;
    const WeaponDef& s = w.stats;
    if (s.mag_size >= 0) {
        if (w.mag <= 0)
            return false;
        w.mag -= 1;
    }
    w.cooldown = s.fire_rate;
    int pellets = std::max(1, s.pellets);
    for (int i = 0; i < pellets; ++i) {
        float angle = p.aim + (frand(world) - 0.5f) * s.spread;
        if (pellets > 1)
            angle += (frand(world) - 0.5f) * s.pellet_spread;
        if (s.fire == FireKind::Hitscan) {
            hitscan_pellet(world, p.pos, angle, s.damage, Owner::Player, s.incendiary);
            continue;
        }
        float speed = s.bullet_speed;
        if (pellets > 1)
            speed *= 0.92f + frand(world) * 0.16f;
        glm::vec2 dir = dir_from_angle(angle);
        Bullet* b = spawn_bullet(world, p.pos + dir * p.radius, dir, speed, s.bullet_radius, s.damage, Owner::Player);
        if (!b)
            break;
        b->kind = s.projectile;
        b->incendiary = s.incendiary;
        b->blast_radius = s.blast_radius;
        b->blast_damage = s.blast_damage;
        b->proximity_radius = s.proximity_radius;
        if (s.lifetime > 0.0f)
            b->lifetime = s.lifetime;
        if (s.projectile == ProjectileKind::Homing) {
            float c = std::clamp(charge, 0.0f, 1.0f);
            b->max_range = s.min_range + (s.max_range - s.min_range) * c;
        }
    }
    emit_sound(world, p.pos, s.sound_radius, SHOOT_SOUND_LIFETIME, SoundType::PlayerShoot);
    add_light(world, p.pos + dir_from_angle(p.aim) * (p.radius + 6.0f), 60.0f, 1.0f, MUZZLE_LIGHT_TTL,
              LightKind::Muzzle);
    p.healing = false;
    p.heal_timer = 0.0f;

    NetMessage m{};
    m.type = NetMessageType::FireWeapon;
    m.pos = p.pos;
    m.aim = p.aim;
    m.weapon = s.name;
    net_emit(world, m);
    return true;
}

void sim_bullets(World& world, float dt) {
    std::vector<Target> player_targets = gather_targets(world, Owner::Player);
    std::vector<Target> enemy_targets = gather_targets(world, Owner::Enemy);
    for (auto& b : world.bullets.data()) {
        if (!b.active)
            continue;
        b.lifetime -= dt;
        if (b.kind == ProjectileKind::Homing)
            steer_homing(world, b, dt);

        glm::vec2 p0 = b.pos;
        float step = b.speed * dt;
        bool range_out = false;
        if (b.kind == ProjectileKind::Homing && b.max_range > 0.0f && b.travelled + step >= b.max_range) {
            step = std::max(0.0f, b.max_range - b.travelled);
            range_out = true;
        }
        glm::vec2 p1 = p0 + b.dir * step;

        float wall_t = 2.0f;
        glm::vec2 wall_point = p1;
        if (auto h = nearest_segment_hit(world, p0, p1)) {
            wall_t = h->t;
            wall_point = h->point;
        }

        auto& targets = b.owner == Owner::Player ? player_targets : enemy_targets;
        const Target* hit = nullptr;
        float hit_t = wall_t;
        for (auto const& t : targets) {
            if (t.enemy) {
                const Enemy* e = world.enemies.get(*t.enemy);
                if (!e || e->health <= 0.0f)
                    continue;
            }
            if (auto tt = segment_circle(p0, p1, t.pos, t.radius + b.radius)) {
                if (*tt < hit_t) {
                    hit_t = *tt;
                    hit = &t;
                }
            }
        }

        const Target* prox = nullptr;
        float prox_t = hit ? hit_t : wall_t;
        if (b.kind == ProjectileKind::Proximity && b.proximity_radius > 0.0f) {
            glm::vec2 seg = p1 - p0;
            float len2 = glm::dot(seg, seg);
            for (auto const& t : targets) {
                if (t.enemy) {
                    const Enemy* e = world.enemies.get(*t.enemy);
                    if (!e || e->health <= 0.0f)
                        continue;
                }
                if (distance_to_segment(t.pos, p0, p1) > b.proximity_radius + t.radius)
                    continue;
                float tt = len2 > 0.0f ? std::clamp(glm::dot(t.pos - p0, seg) / len2, 0.0f, 1.0f) : 0.0f;
                if (!line_of_sight(p0 + seg * tt, t.pos, world.segments))
                    continue;
                if (tt < prox_t) {
                    prox_t = tt;
                    prox = &t;
                }
            }
        }

        if (prox) {
            glm::vec2 at = p0 + (p1 - p0) * prox_t;
            b.pos = at;
            detonate_bullet(world, b, at, prox);
            world.bullets.release(b.vid);
            continue;
        }
        if (hit) {
            glm::vec2 at = p0 + (p1 - p0) * hit_t;
            b.pos = at;
            if (b.kind == ProjectileKind::Explosive || b.kind == ProjectileKind::Proximity)
                detonate_bullet(world, b, at, hit);
            else
                hit_target(world, *hit, b.damage, p0, b.incendiary);
            world.bullets.release(b.vid);
            continue;
        }
        if (wall_t <= 1.0f) {
            // Back off the surface so the blast is not occluded by the wall it hit.
            glm::vec2 at = wall_point - b.dir * 1.0f;
            b.pos = at;
            if (b.blast_radius > 0.0f)
                detonate_bullet(world, b, at, nullptr);
            else
                wall_impact(world, wall_point);
            world.bullets.release(b.vid);
            continue;
        }

        b.pos = p1;
        b.travelled += step;
        if (range_out) {
            airburst(world, b.pos);
            world.bullets.release(b.vid);
            continue;
        }
        bool outside = b.pos.x < -50.0f || b.pos.y < -50.0f || b.pos.x > world.size.x + 50.0f ||
                       b.pos.y > world.size.y + 50.0f;
        if (b.lifetime <= 0.0f || outside)
            world.bullets.release(b.vid);
    }
}

void blast(World& world, glm::vec2 center, float radius, float enemy_damage, float player_damage,
           bool destroy_locked_doors) {
    if (radius <= 0.0f)
        return;
    for (auto& e : world.enemies.data()) {
        if (!e.active || e.health <= 0.0f || enemy_damage <= 0.0f)
            continue;
        float d = glm::length(e.pos - center);
        if (d > radius || !line_of_sight(center, e.pos, world.segments))
            continue;
        damage_enemy(e, enemy_damage * (1.0f - d / radius));
    }
    if (player_damage > 0.0f) {
        Player& p = world.player;
        float d = glm::length(p.pos - center);
        if (d <= radius && line_of_sight(center, p.pos, world.segments))
            damage_player(world, player_damage * (1.0f - d / radius), center);
    }
    if (destroy_locked_doors) {
        auto gone = [&](const Door& d) {
            return d.locked && glm::length(door_mid(d) - center) <= radius;
        };
        world.doors.erase(std::remove_if(world.doors.begin(), world.doors.end(), gone), world.doors.end());
    }
    world.fx.rings.push_back(ExplosionRing{center, radius});
    add_light(world, center, radius, 2.0f, 0.3f, LightKind::Explosion);
}

void airburst(World& world, glm::vec2 at) {
    const Enemy* best = nullptr;
    int best_count = 0;
    for (auto const& c : world.enemies.data()) {
        if (!c.active || c.health <= 0.0f || glm::length(c.pos - at) > AIRBURST_SEARCH_RADIUS)
            continue;
        int n = 0;
        for (auto const& o : world.enemies.data()) {
            if (o.active && o.health > 0.0f && glm::length(o.pos - c.pos) <= AIRBURST_RADIUS)
                ++n;
        }
        if (n > best_count) {
            best_count = n;
            best = &c;
        }
    }
    glm::vec2 center = best ? best->pos : at;
    if (best) {
        for (auto& e : world.enemies.data()) {
            if (!e.active || e.health <= 0.0f || glm::length(e.pos - center) > AIRBURST_RADIUS)
                continue;
            damage_enemy(e, AIRBURST_DAMAGE);
            add_bleed_stack(e.status);
        }
    }
    explosion_fx(world, center, AIRBURST_RADIUS, AIRBURST_SOUND_RADIUS);
}

float flash_duration(float facing, glm::vec2 victim, glm::vec2 source) {
    float diff = std::fabs(wrap_angle(angle_of(source - victim) - facing));
    float factor = std::clamp(1.0f - diff / PI, 0.0f, 1.0f);
    return FLASH_MIN_SECONDS + (FLASH_MAX_SECONDS - FLASH_MIN_SECONDS) * factor;
}

void flash(World& world, glm::vec2 pos, float radius) {
    Player& p = world.player;
    if (p.health > 0.0f && glm::length(p.pos - pos) <= radius) {
        auto view = vision_polygon(p.pos, world.segments, far_distance(world));
        if (point_in_polygon(pos, view))
            p.flash_timer = std::max(p.flash_timer, flash_duration(p.aim, p.pos, pos));
    }
    for (auto& e : world.enemies.data()) {
        if (!e.active || e.health <= 0.0f || glm::length(e.pos - pos) > radius)
            continue;
        if (!line_of_sight(pos, e.pos, world.segments))
            continue;
        e.stun_timer = std::max(e.stun_timer, flash_duration(e.facing, e.pos, pos));
        e.alert = false;
        e.state = AiState::Searching;
        e.search_timer = ENEMY_SEARCH_SECONDS;
        e.search_base_facing = e.facing;
    }
    add_light(world, pos, radius, 3.0f, 0.25f, LightKind::Flash);
}

void start_melee(World& world) {
    Player& p = world.player;
    if (world.swing.active || p.melee_cooldown > 0.0f)
        return;
    if (p.melee == MeleeKind::Shield) {
        shield_bash(world);
        p.melee_cooldown = SHIELD_BASH_COOLDOWN;
        return;
    }
    MeleeSwing& s = world.swing;
    s.active = true;
    s.elapsed = 0.0f;
    s.start_angle = p.aim - BLADE_SWEEP_DEG * PI / 360.0f;
    s.prev_angle = s.start_angle;
    s.angle = s.start_angle;
    s.reach = BLADE_RANGE;
    s.blocked = false;
    s.hit.clear();
    p.melee_cooldown = BLADE_COOLDOWN;
    emit_sound(world, p.pos, SLASH_SOUND_RADIUS, 0.3f, SoundType::Slash);
}

void sim_melee(World& world, float dt) {
    MeleeSwing& s = world.swing;
    if (!s.active)
        return;
    Player& p = world.player;
    s.elapsed += dt;
    float k = std::min(1.0f, s.elapsed / BLADE_DURATION);
    float eased = 1.0f - (1.0f - k) * (1.0f - k) * (1.0f - k);
    s.prev_angle = s.angle;
    s.angle = s.start_angle + BLADE_SWEEP_DEG * PI / 180.0f * eased;

    // Outer radius stops at the first obstruction along the current angle.
    s.reach = BLADE_RANGE;
    glm::vec2 dir = dir_from_angle(s.angle);
    for (auto const& seg : world.segments) {
        if (auto h = ray_segment(p.pos, dir, seg))
            s.reach = std::min(s.reach, h->t);
    }
    if (s.reach < BLADE_RANGE && !s.blocked) {
        s.blocked = true;
        emit_sound(world, p.pos + dir * s.reach, BLOCKED_SLASH_SOUND_RADIUS, 0.3f, SoundType::Impact);
    }

    float pad = BLADE_WIDTH_DEG * PI / 360.0f;
    for (auto& e : world.enemies.data()) {
        if (!e.active || e.health <= 0.0f)
            continue;
        if (std::find(s.hit.begin(), s.hit.end(), e.vid) != s.hit.end())
            continue;
        float d = glm::length(e.pos - p.pos);
        if (d < BLADE_INNER || d - e.radius > s.reach)
            continue;
        if (!angle_in_sweep(angle_of(e.pos - p.pos), s.prev_angle, s.angle - s.prev_angle, pad))
            continue;
        if (!line_of_sight(p.pos, e.pos, world.segments))
            continue;
        damage_enemy(e, e.health);
        s.hit.push_back(e.vid);
        world.fx.hits.push_back(HitMarker{e.pos});
        emit_sound(world, e.pos, FLESH_SOUND_RADIUS, FLESH_SOUND_LIFETIME, SoundType::Impact);
    }

    if (k >= 1.0f) {
        s.active = false;
        s.hit.clear();
    }
}

void shield_bash(World& world) {
    Player& p = world.player;
    float half_cone = SHIELD_BASH_CONE_DEG * PI / 360.0f;
    for (auto& e : world.enemies.data()) {
        if (!e.active || e.health <= 0.0f)
            continue;
        glm::vec2 to = e.pos - p.pos;
        if (glm::length(to) - e.radius > SHIELD_BASH_RANGE)
            continue;
        if (std::fabs(wrap_angle(angle_of(to) - p.aim)) > half_cone)
            continue;
        if (!line_of_sight(p.pos, e.pos, world.segments))
            continue;
        damage_enemy(e, SHIELD_BASH_DAMAGE);
        e.stun_timer = std::max(e.stun_timer, SHIELD_BASH_STUN);
        world.fx.hits.push_back(HitMarker{e.pos});
    }
    emit_sound(world, p.pos, SLASH_SOUND_RADIUS, 0.3f, SoundType::Slash);
}
