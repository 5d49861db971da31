#include "player.hpp"

#include "combat.hpp"
#include "net.hpp"
#include "throwables.hpp"
#include "world.hpp"

#include <algorithm>
#include <cmath>

inline constexpr float DOOR_INTERACT_REACH = 20.0f;

bool start_reload(Weapon& w) {
    const WeaponDef& s = w.stats;
    if (w.reloading || s.mag_size < 0 || w.mag >= s.mag_size || w.reserve <= 0)
        return false;
    w.reloading = true;
    w.reload_timer = s.reload_time;
    return true;
}

void finish_reload(Weapon& w) {
    int needed = std::max(0, w.stats.mag_size - w.mag);
    int moved = std::min(needed, w.reserve);
    w.mag += moved;
    w.reserve = std::max(0, w.reserve - moved);
    w.reloading = false;
    w.reload_timer = 0.0f;
}

bool start_heal(World& world) {
    Player& p = world.player;
    if (p.healing || p.medkits <= 0 || p.health >= p.max_health || p.health <= 0.0f)
        return false;
    p.healing = true;
    p.heal_timer = HEAL_CHANNEL_SECONDS;
    return true;
}

bool try_takedown(World& world) {
    Player& p = world.player;
    for (auto& e : world.enemies.data()) {
        if (!e.active || e.health <= 0.0f || e.alert)
            continue;
        glm::vec2 to_player = p.pos - e.pos;
        float d = glm::length(to_player);
        if (d > p.radius + e.radius + TAKEDOWN_REACH)
            continue;
        if (glm::dot(dir_from_angle(e.facing), safe_normalize(to_player)) >= TAKEDOWN_BEHIND_DOT)
            continue;
        damage_enemy(e, e.health);
        world.fx.hits.push_back(HitMarker{e.pos});
        emit_sound(world, e.pos, SLASH_SOUND_RADIUS, 0.3f, SoundType::Slash);
        return true;
    }
    return false;
}

static void switch_to(Player& p, int index) {
    int n = static_cast<int>(p.weapons.size());
    if (n == 0)
        return;
    index = ((index % n) + n) % n;
    if (index == p.active_weapon)
        return;
    if (Weapon* w = active_weapon(p)) {
        w->reloading = false;
        w->reload_timer = 0.0f;
        w->charging = false;
        w->charge = 0.0f;
    }
    p.active_weapon = index;
}

static Door* nearest_door(World& world, float reach) {
    Player& p = world.player;
    Door* best = nullptr;
    float best_d = 0.0f;
    for (auto& d : world.doors) {
        float dist = distance_to_segment(p.pos, d.hinge, door_end(d));
        if (dist > p.radius + d.thickness * 0.5f + reach)
            continue;
        if (!best || dist < best_d) {
            best = &d;
            best_d = dist;
        }
    }
    return best;
}

static void sim_interact(World& world, const PlayerCommands& cmd) {
    Player& p = world.player;
    bool pressed = cmd.interact && !p.interact_was_down;
    p.interact_was_down = cmd.interact;
    if (pressed && try_takedown(world))
        return;
    Door* d = nearest_door(world, DOOR_INTERACT_REACH);
    if (!d || d->locked)
        return;
    if (pressed) {
        if (p.last_door_id == d->id && p.last_interact_time >= 0.0 &&
            world.now - p.last_interact_time <= DOOR_DOUBLE_TAP_SECONDS) {
            door_toggle(*d);
            p.last_interact_time = -1.0;
            return;
        }
        p.last_interact_time = world.now;
        p.last_door_id = d->id;
    }
    if (!cmd.interact || d->target_angle)
        return;
    // Push the leaf away from the player, or pull with the reverse modifier.
    glm::vec2 dv = door_end(*d) - d->hinge;
    glm::vec2 ap = p.pos - d->hinge;
    float side = dv.x * ap.y - dv.y * ap.x;
    float s = side > 0.0f ? -1.0f : 1.0f;
    if (cmd.interact_reverse)
        s = -s;
    door_push(*d, s * static_cast<float>(d->swing_dir));
}

static void sim_throwable_input(World& world, const PlayerCommands& cmd, float dt) {
    Player& p = world.player;
    if (cmd.cycle_throwable && !p.cooking) {
        for (int i = 1; i <= THROWABLE_KIND_COUNT; ++i) {
            int k = (static_cast<int>(p.active_throwable) + i) % THROWABLE_KIND_COUNT;
            if (p.throwables[static_cast<size_t>(k)] > 0) {
                p.active_throwable = static_cast<ThrowableKind>(k);
                break;
            }
        }
    }
    int& count = p.throwables[static_cast<size_t>(p.active_throwable)];
    if (cmd.throw_held && !p.cooking && count > 0) {
        p.cooking = true;
        p.cook_timer = throwable_def(world, p.active_throwable).fuse;
    }
    if (!p.cooking)
        return;
    p.cook_timer -= dt;
    if (p.cook_timer <= 0.0f) {
        // Held too long.
        p.cooking = false;
        count = std::max(0, count - 1);
        detonate_throwable(world, p.active_throwable, p.pos);
        if (p.active_throwable == ThrowableKind::Flashbang)
            p.flash_timer = FLASH_MAX_SECONDS;
        return;
    }
    if (!cmd.throw_held) {
        p.cooking = false;
        count = std::max(0, count - 1);
        throw_throwable(world, p.active_throwable, p.pos, p.aim_point, p.cook_timer);
    }
}

static void sim_trigger(World& world, const PlayerCommands& cmd, float dt) {
    Player& p = world.player;
    bool pressed = cmd.fire && !p.fire_was_down;
    p.fire_was_down = cmd.fire;
    if (p.mode == CombatMode::Melee) {
        if (pressed)
            start_melee(world);
        return;
    }
    Weapon* w = active_weapon(p);
    if (!w)
        return;
    if (w->stats.charge_time > 0.0f) {
        if (cmd.fire) {
            w->charging = true;
            w->charge = std::min(1.0f, w->charge + dt / w->stats.charge_time);
        } else if (w->charging) {
            fire_weapon(world, *w, w->charge);
            w->charging = false;
            w->charge = 0.0f;
        }
        return;
    }
    if (w->stats.automatic ? cmd.fire : pressed)
        fire_weapon(world, *w, 1.0f);
}

void sim_player(World& world, const PlayerCommands& cmd, float dt) {
    Player& p = world.player;
    for (auto& d : world.doors)
        d.held = false;
    if (p.health <= 0.0f)
        return;

    p.melee_cooldown = std::max(0.0f, p.melee_cooldown - dt);
    for (auto& w : p.weapons)
        w.cooldown = std::max(0.0f, w.cooldown - dt);
    p.step_sound_timer = std::max(0.0f, p.step_sound_timer - dt);

    p.aim_point = cmd.aim_point;
    glm::vec2 to_aim = cmd.aim_point - p.pos;
    if (glm::dot(to_aim, to_aim) > 1e-6f)
        p.aim = angle_of(to_aim);

    if (cmd.toggle_mode)
        p.mode = p.mode == CombatMode::Gun ? CombatMode::Melee : CombatMode::Gun;
    if (cmd.select_weapon >= 0 && cmd.select_weapon < static_cast<int>(p.weapons.size()))
        switch_to(p, cmd.select_weapon);
    else if (cmd.switch_weapon != 0)
        switch_to(p, p.active_weapon + (cmd.switch_weapon > 0 ? 1 : -1));

    if (cmd.drop_weapon && p.weapons.size() > 1) {
        NetMessage m{};
        m.type = NetMessageType::DropWeapon;
        m.pos = p.pos;
        m.weapon = p.weapons[static_cast<size_t>(p.active_weapon)].stats.name;
        net_emit(world, m);
        p.weapons.erase(p.weapons.begin() + p.active_weapon);
        p.active_weapon = std::min(p.active_weapon, static_cast<int>(p.weapons.size()) - 1);
    }
    // Shop and ground pickups are granted by the host's reply, not locally.
    if (!cmd.buy_weapon.empty()) {
        NetMessage m{};
        m.type = NetMessageType::BuyWeapon;
        m.weapon = cmd.buy_weapon;
        net_emit(world, m);
    }
    if (!cmd.pickup_weapon.empty()) {
        NetMessage m{};
        m.type = NetMessageType::PickupWeapon;
        m.weapon = cmd.pickup_weapon;
        m.pos = p.pos;
        net_emit(world, m);
    }

    glm::vec2 dir = safe_normalize(cmd.move, {0.0f, 0.0f});
    if (dir != glm::vec2{0.0f, 0.0f}) {
        p.pos += dir * PLAYER_SPEED * dt;
        resolve_unit_collisions(world, p.pos, p.radius, PLAYER_COLLISION_ITERATIONS);
        p.healing = false;
        p.heal_timer = 0.0f;
        if (p.step_sound_timer <= 0.0f) {
            emit_sound(world, p.pos, PLAYER_STEP_SOUND_RADIUS, 0.3f, SoundType::PlayerMove);
            p.step_sound_timer = PLAYER_STEP_SOUND_INTERVAL;
        }
    }

    if (Weapon* w = active_weapon(p)) {
        if (cmd.reload)
            start_reload(*w);
        if (w->reloading) {
            w->reload_timer -= dt;
            if (w->reload_timer <= 0.0f)
                finish_reload(*w);
        }
    }

    if (cmd.heal)
        start_heal(world);
    if (p.healing) {
        p.heal_timer -= dt;
        if (p.heal_timer <= 0.0f) {
            p.health = std::min(p.max_health, p.health + HEAL_AMOUNT);
            p.medkits = std::max(0, p.medkits - 1);
            p.healing = false;
            p.heal_timer = 0.0f;
        }
    }

    sim_trigger(world, cmd, dt);
    sim_throwable_input(world, cmd, dt);
    sim_interact(world, cmd);
}
