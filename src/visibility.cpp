#include "visibility.hpp"

#include <algorithm>
#include <cmath>

std::vector<glm::vec2> vision_polygon(glm::vec2 origin, const std::vector<Segment>& segments,
                                      float far_distance) {
    std::vector<float> angles;
    angles.reserve(segments.size() * 6);
    auto push_endpoint = [&](glm::vec2 p) {
        float a = std::atan2(p.y - origin.y, p.x - origin.x);
        angles.push_back(wrap_angle(a - VISION_ANGLE_EPS));
        angles.push_back(wrap_angle(a));
        angles.push_back(wrap_angle(a + VISION_ANGLE_EPS));
    };
    for (auto const& s : segments) {
        push_endpoint(s.a);
        push_endpoint(s.b);
    }
    std::sort(angles.begin(), angles.end());
    angles.erase(std::unique(angles.begin(), angles.end()), angles.end());

    std::vector<glm::vec2> poly;
    poly.reserve(angles.size());
    for (float a : angles) {
        glm::vec2 dir = dir_from_angle(a);
        float best = far_distance;
        for (auto const& s : segments) {
            if (auto hit = ray_segment(origin, dir, s)) {
                if (hit->t < best)
                    best = hit->t;
            }
        }
        poly.push_back(origin + dir * best);
    }
    return poly;
}

bool point_in_polygon(glm::vec2 p, const std::vector<glm::vec2>& poly) {
    bool inside = false;
    std::size_t n = poly.size();
    if (n < 3)
        return false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        glm::vec2 pi = poly[i];
        glm::vec2 pj = poly[j];
        bool crosses = (pi.y > p.y) != (pj.y > p.y);
        if (crosses && p.x < (pj.x - pi.x) * (p.y - pi.y) / (pj.y - pi.y + 1e-9f) + pi.x)
            inside = !inside;
    }
    return inside;
}

bool line_of_sight(glm::vec2 a, glm::vec2 b, const std::vector<Segment>& segments) {
    for (auto const& s : segments) {
        if (segment_segment(a, b, s))
            return false;
    }
    return true;
}
