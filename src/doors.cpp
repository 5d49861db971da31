#include "doors.hpp"

#include "world.hpp"

#include <algorithm>
#include <cmath>

glm::vec2 door_end(const Door& d, float angle) { return d.hinge + dir_from_angle(angle) * d.length; }

glm::vec2 door_mid(const Door& d) { return d.hinge + dir_from_angle(d.angle) * (d.length * 0.5f); }

float door_open_angle(const Door& d) {
    return d.closed_angle + d.max_open * static_cast<float>(d.swing_dir);
}

float door_min_angle(const Door& d) { return std::min(d.closed_angle, door_open_angle(d)); }

float door_max_angle(const Door& d) { return std::max(d.closed_angle, door_open_angle(d)); }

bool door_is_closed(const Door& d) { return std::fabs(d.angle - d.closed_angle) < DOOR_CLOSED_EPS; }

std::vector<Segment> build_dynamic_segments(const std::vector<Wall>& walls, const std::vector<Door>& doors) {
    std::vector<Segment> out;
    out.reserve(walls.size() * 4 + doors.size());
    for (auto const& w : walls)
        append_wall_edges(out, w);
    for (auto const& d : doors)
        out.push_back({d.hinge, door_end(d)});
    return out;
}

void door_push(Door& d, float dir) {
    if (d.locked)
        return;
    d.target_angle.reset();
    d.angular_vel = DOOR_PUSH_SPEED * dir * static_cast<float>(d.swing_dir);
    d.held = true;
}

void door_toggle(Door& d) {
    if (d.locked)
        return;
    float open = door_open_angle(d);
    bool nearer_open = std::fabs(d.angle - open) < std::fabs(d.angle - d.closed_angle);
    d.target_angle = nearer_open ? d.closed_angle : open;
    d.angular_vel = 0.0f;
}

void door_auto_open(Door& d) {
    if (d.locked || d.target_angle)
        return;
    d.target_angle = door_open_angle(d);
}

struct PendingPush {
    glm::vec2* pos;
    glm::vec2 to;
};

static bool unit_push(const World& world, const Door& d, float angle, glm::vec2& pos, float radius,
                      std::vector<PendingPush>& pushes) {
    glm::vec2 moved = pos;
    if (!resolve_circle_capsule(moved, radius, d.hinge, door_end(d, angle), d.thickness * 0.5f))
        return true;
    for (auto const& w : world.walls)
        if (circle_overlaps_wall(moved, radius, w))
            return false;
    pushes.push_back({&pos, moved});
    return true;
}

void sim_doors(World& world, float dt) {
    for (auto& d : world.doors) {
        const float prev = d.angle;
        float next = prev;
        if (d.target_angle) {
            float diff = *d.target_angle - prev;
            float step = DOOR_AUTO_SWING_SPEED * dt;
            if (std::fabs(diff) < DOOR_ARRIVE_EPS || std::fabs(diff) <= step) {
                next = *d.target_angle;
                d.target_angle.reset();
                d.angular_vel = 0.0f;
            } else {
                next = prev + (diff > 0.0f ? step : -step);
            }
        } else {
            next = prev + d.angular_vel * dt;
            if (!d.held)
                d.angular_vel *= std::max(0.0f, 1.0f - dt * DOOR_DAMPING);
        }
        next = std::clamp(next, door_min_angle(d), door_max_angle(d));
        if (next == door_min_angle(d) || next == door_max_angle(d)) {
            if ((next == door_max_angle(d) && d.angular_vel > 0.0f) ||
                (next == door_min_angle(d) && d.angular_vel < 0.0f))
                d.angular_vel = 0.0f;
        }

        if (std::fabs(next - prev) < 1e-6f) {
            if (std::fabs(d.angular_vel) < 0.01f)
                d.angular_vel = 0.0f;
            continue;
        }

        // Reject the whole step if the leaf would enter a wall or crush a unit into one.
        bool blocked = false;
        glm::vec2 mid = d.hinge + dir_from_angle(next) * (d.length * 0.5f);
        glm::vec2 end = door_end(d, next);
        for (auto const& w : world.walls) {
            if (point_in_wall(mid, w) || point_in_wall(end, w)) {
                blocked = true;
                break;
            }
        }
        std::vector<PendingPush> pushes;
        if (!blocked && world.player.health > 0.0f)
            blocked = !unit_push(world, d, next, world.player.pos, world.player.radius, pushes);
        if (!blocked) {
            for (auto& e : world.enemies.data()) {
                if (!e.active || e.health <= 0.0f)
                    continue;
                if (!unit_push(world, d, next, e.pos, e.radius, pushes)) {
                    blocked = true;
                    break;
                }
            }
        }
        if (blocked) {
            d.angle = prev;
            d.angular_vel = 0.0f;
            d.target_angle.reset();
            continue;
        }
        for (auto& p : pushes)
            *p.pos = p.to;
        d.angle = next;

        float speed = dt > 0.0f ? std::fabs(next - prev) / dt : 0.0f;
        if (speed > DOOR_SOUND_SPEED &&
            (d.last_sound_time < 0.0 || world.now - d.last_sound_time > DOOR_SOUND_COOLDOWN)) {
            float radius = speed > DOOR_SOUND_FAST_SPEED ? DOOR_SOUND_RADIUS_FAST : DOOR_SOUND_RADIUS_SLOW;
            emit_sound(world, door_mid(d), radius, 0.3f, SoundType::Door);
            d.last_sound_time = world.now;
        }
    }
}
