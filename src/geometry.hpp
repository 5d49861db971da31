#pragma once

#include <glm/glm.hpp>
#include <optional>
#include <vector>

// Axis-aligned static wall, world units, top-left origin.
struct Wall {
    glm::vec2 pos{0.0f, 0.0f};
    glm::vec2 size{0.0f, 0.0f};
};

struct Segment {
    glm::vec2 a{0.0f, 0.0f};
    glm::vec2 b{0.0f, 0.0f};
};

// Parametric hit: `t` is in units of the query direction (ray) or of the query segment (0..1).
struct RayHit {
    float t{0.0f};
    glm::vec2 point{0.0f, 0.0f};
};

inline constexpr float GEOM_PARALLEL_EPS = 1e-8f;

glm::vec2 safe_normalize(glm::vec2 v, glm::vec2 fallback = {1.0f, 0.0f});
float angle_of(glm::vec2 v);
glm::vec2 dir_from_angle(float a);
// Wrap to (-pi, pi].
float wrap_angle(float a);
// True if `a` lies in the band swept counter-clockwise from `from` by `span` radians, padded
// by `pad` on both sides. Wrap-aware; span is clamped to [0, 2pi].
bool angle_in_sweep(float a, float from, float span, float pad);

glm::vec2 closest_point_on_segment(glm::vec2 p, glm::vec2 a, glm::vec2 b);
float distance_to_segment(glm::vec2 p, glm::vec2 a, glm::vec2 b);

// Ray origin + dir * t against a segment; t >= 0.
std::optional<RayHit> ray_segment(glm::vec2 origin, glm::vec2 dir, const Segment& s);
// Segment p0->p1 against a segment; t in [0, 1] along p0->p1.
std::optional<RayHit> segment_segment(glm::vec2 p0, glm::vec2 p1, const Segment& s);
// Swept test of p0->p1 against a circle. A start point inside the circle hits at t = 0.
std::optional<float> segment_circle(glm::vec2 p0, glm::vec2 p1, glm::vec2 center, float radius);

bool point_in_wall(glm::vec2 p, const Wall& w);
bool circle_overlaps_wall(glm::vec2 c, float r, const Wall& w);
// Pushes `c` out of the wall. Returns true when a push happened.
bool resolve_circle_wall(glm::vec2& c, float r, const Wall& w);
// Door-like capsule around a->b with the given half thickness.
bool circle_overlaps_capsule(glm::vec2 c, float r, glm::vec2 a, glm::vec2 b, float half_thickness);
bool resolve_circle_capsule(glm::vec2& c, float r, glm::vec2 a, glm::vec2 b, float half_thickness);

// Four edges per wall.
void append_wall_edges(std::vector<Segment>& out, const Wall& w);
