#pragma once

#include "geometry.hpp"

#include <glm/glm.hpp>
#include <vector>

inline constexpr float VISION_ANGLE_EPS = 1e-4f;

// Shadow-cast vision polygon from `origin` against `segments`. Rays that hit nothing end at
// `far_distance`. Points are sorted by angle in (-pi, pi].
std::vector<glm::vec2> vision_polygon(glm::vec2 origin, const std::vector<Segment>& segments,
                                      float far_distance);

bool point_in_polygon(glm::vec2 p, const std::vector<glm::vec2>& poly);

// True when no segment crosses the straight line a->b.
bool line_of_sight(glm::vec2 a, glm::vec2 b, const std::vector<Segment>& segments);
