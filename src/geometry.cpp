#include "geometry.hpp"

#include "settings.hpp"

#include <algorithm>
#include <cmath>

static float cross2(glm::vec2 a, glm::vec2 b) { return a.x * b.y - a.y * b.x; }

glm::vec2 safe_normalize(glm::vec2 v, glm::vec2 fallback) {
    float len = glm::length(v);
    if (!(len > 1e-6f))
        return fallback;
    return v / len;
}

float angle_of(glm::vec2 v) { return std::atan2(v.y, v.x); }

glm::vec2 dir_from_angle(float a) { return {std::cos(a), std::sin(a)}; }

float wrap_angle(float a) {
    if (!std::isfinite(a))
        return 0.0f;
    a = std::fmod(a + PI, 2.0f * PI);
    if (a <= 0.0f)
        a += 2.0f * PI;
    return a - PI;
}

bool angle_in_sweep(float a, float from, float span, float pad) {
    span = std::clamp(span, 0.0f, 2.0f * PI);
    if (span + 2.0f * pad >= 2.0f * PI)
        return true;
    // Offset from the padded band start, measured counter-clockwise in [0, 2pi).
    float d = std::fmod(a - (from - pad), 2.0f * PI);
    if (d < 0.0f)
        d += 2.0f * PI;
    return d <= span + 2.0f * pad;
}

glm::vec2 closest_point_on_segment(glm::vec2 p, glm::vec2 a, glm::vec2 b) {
    glm::vec2 ab = b - a;
    float len2 = glm::dot(ab, ab);
    if (len2 <= 0.0f)
        return a;
    float t = std::clamp(glm::dot(p - a, ab) / len2, 0.0f, 1.0f);
    return a + ab * t;
}

float distance_to_segment(glm::vec2 p, glm::vec2 a, glm::vec2 b) {
    return glm::length(p - closest_point_on_segment(p, a, b));
}

std::optional<RayHit> ray_segment(glm::vec2 origin, glm::vec2 dir, const Segment& s) {
    glm::vec2 e = s.b - s.a;
    float den = cross2(dir, e);
    if (std::fabs(den) < GEOM_PARALLEL_EPS)
        return std::nullopt;
    glm::vec2 d = s.a - origin;
    float t = cross2(d, e) / den;
    float u = cross2(d, dir) / den;
    if (t >= 0.0f && u >= 0.0f && u <= 1.0f)
        return RayHit{t, origin + dir * t};
    return std::nullopt;
}

std::optional<RayHit> segment_segment(glm::vec2 p0, glm::vec2 p1, const Segment& s) {
    glm::vec2 r = p1 - p0;
    glm::vec2 e = s.b - s.a;
    float den = cross2(r, e);
    if (std::fabs(den) < GEOM_PARALLEL_EPS)
        return std::nullopt;
    glm::vec2 d = s.a - p0;
    float t = cross2(d, e) / den;
    float u = cross2(d, r) / den;
    if (t >= 0.0f && t <= 1.0f && u >= 0.0f && u <= 1.0f)
        return RayHit{t, p0 + r * t};
    return std::nullopt;
}

std::optional<float> segment_circle(glm::vec2 p0, glm::vec2 p1, glm::vec2 center, float radius) {
    glm::vec2 d = p1 - p0;
    glm::vec2 f = p0 - center;
    float c = glm::dot(f, f) - radius * radius;
    if (c < 0.0f)
        return 0.0f;
    float a = glm::dot(d, d);
    if (a <= 0.0f)
        return std::nullopt;
    float b = 2.0f * glm::dot(f, d);
    float disc = b * b - 4.0f * a * c;
    if (disc < 0.0f)
        return std::nullopt;
    float t = (-b - std::sqrt(disc)) / (2.0f * a);
    if (t >= 0.0f && t <= 1.0f)
        return t;
    return std::nullopt;
}

bool point_in_wall(glm::vec2 p, const Wall& w) {
    return p.x >= w.pos.x && p.x <= w.pos.x + w.size.x && p.y >= w.pos.y &&
           p.y <= w.pos.y + w.size.y;
}

static glm::vec2 clamp_to_wall(glm::vec2 c, const Wall& w) {
    return {std::clamp(c.x, w.pos.x, w.pos.x + w.size.x),
            std::clamp(c.y, w.pos.y, w.pos.y + w.size.y)};
}

bool circle_overlaps_wall(glm::vec2 c, float r, const Wall& w) {
    glm::vec2 d = c - clamp_to_wall(c, w);
    return glm::dot(d, d) < r * r;
}

bool resolve_circle_wall(glm::vec2& c, float r, const Wall& w) {
    glm::vec2 closest = clamp_to_wall(c, w);
    glm::vec2 d = c - closest;
    float dist = glm::length(d);
    if (dist >= r)
        return false;
    if (dist > 0.0f) {
        c += (d / dist) * (r - dist + COLLISION_SKIN);
        return true;
    }
    // Center inside: leave through the nearest face.
    float left = c.x - w.pos.x;
    float right = w.pos.x + w.size.x - c.x;
    float top = c.y - w.pos.y;
    float bottom = w.pos.y + w.size.y - c.y;
    float m = std::min(std::min(left, right), std::min(top, bottom));
    if (m == left)
        c.x = w.pos.x - r - COLLISION_SKIN;
    else if (m == right)
        c.x = w.pos.x + w.size.x + r + COLLISION_SKIN;
    else if (m == top)
        c.y = w.pos.y - r - COLLISION_SKIN;
    else
        c.y = w.pos.y + w.size.y + r + COLLISION_SKIN;
    return true;
}

bool circle_overlaps_capsule(glm::vec2 c, float r, glm::vec2 a, glm::vec2 b, float half_thickness) {
    float min_dist = r + half_thickness;
    glm::vec2 d = c - closest_point_on_segment(c, a, b);
    return glm::dot(d, d) < min_dist * min_dist;
}

bool resolve_circle_capsule(glm::vec2& c, float r, glm::vec2 a, glm::vec2 b, float half_thickness) {
    glm::vec2 cp = closest_point_on_segment(c, a, b);
    glm::vec2 d = c - cp;
    float dist = glm::length(d);
    float min_dist = r + half_thickness;
    if (dist >= min_dist)
        return false;
    glm::vec2 n;
    if (dist > 1e-6f) {
        n = d / dist;
    } else {
        glm::vec2 e = b - a;
        n = safe_normalize({-e.y, e.x}, {0.0f, 1.0f});
    }
    c += n * (min_dist - dist + COLLISION_SKIN);
    return true;
}

void append_wall_edges(std::vector<Segment>& out, const Wall& w) {
    glm::vec2 p0 = w.pos;
    glm::vec2 p1 = {w.pos.x + w.size.x, w.pos.y};
    glm::vec2 p2 = w.pos + w.size;
    glm::vec2 p3 = {w.pos.x, w.pos.y + w.size.y};
    out.push_back({p0, p1});
    out.push_back({p1, p2});
    out.push_back({p2, p3});
    out.push_back({p3, p0});
}
