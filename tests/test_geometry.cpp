#include <doctest/doctest.h>

#include "geometry.hpp"
#include "settings.hpp"

#include <cmath>

TEST_CASE("resolve_circle_wall moves the circle out and away") {
    Wall w{{100.0f, 100.0f}, {50.0f, 50.0f}};
    glm::vec2 c{95.0f, 125.0f};
    const float r = 10.0f;
    REQUIRE(circle_overlaps_wall(c, r, w));
    glm::vec2 before = c;
    CHECK(resolve_circle_wall(c, r, w));
    CHECK_FALSE(circle_overlaps_wall(c, r, w));
    CHECK(c.x < before.x);
    CHECK(c.y == doctest::Approx(before.y));
    CHECK(c.x == doctest::Approx(100.0f - r - COLLISION_SKIN));
}

TEST_CASE("resolve_circle_wall handles a center inside the wall") {
    Wall w{{100.0f, 100.0f}, {50.0f, 50.0f}};
    glm::vec2 c{104.0f, 130.0f};
    CHECK(resolve_circle_wall(c, 6.0f, w));
    CHECK_FALSE(circle_overlaps_wall(c, 6.0f, w));
    // Nearest face is the left one.
    CHECK(c.x < 100.0f);
}

TEST_CASE("resolve_circle_wall leaves a clear circle alone") {
    Wall w{{100.0f, 100.0f}, {50.0f, 50.0f}};
    glm::vec2 c{50.0f, 50.0f};
    CHECK_FALSE(resolve_circle_wall(c, 10.0f, w));
    CHECK(c == glm::vec2{50.0f, 50.0f});
}

TEST_CASE("swept tests catch thin obstacles crossed within one step") {
    Segment thin{{500.0f, 0.0f}, {500.0f, 100.0f}};
    auto h = segment_segment({0.0f, 50.0f}, {1000.0f, 50.0f}, thin);
    REQUIRE(h);
    CHECK(h->t == doctest::Approx(0.5f));
    CHECK(h->point.x == doctest::Approx(500.0f));

    auto c = segment_circle({0.0f, 0.0f}, {200.0f, 0.0f}, {100.0f, 0.0f}, 5.0f);
    REQUIRE(c);
    CHECK(*c == doctest::Approx(0.475f));

    CHECK_FALSE(segment_circle({0.0f, 0.0f}, {200.0f, 0.0f}, {100.0f, 20.0f}, 5.0f));
    auto inside = segment_circle({100.0f, 1.0f}, {200.0f, 1.0f}, {100.0f, 0.0f}, 5.0f);
    REQUIRE(inside);
    CHECK(*inside == doctest::Approx(0.0f));
}

TEST_CASE("parallel and collinear queries report no hit") {
    Segment s{{0.0f, 5.0f}, {10.0f, 5.0f}};
    CHECK_FALSE(ray_segment({0.0f, 0.0f}, {1.0f, 0.0f}, s));
    Segment collinear{{5.0f, 0.0f}, {10.0f, 0.0f}};
    CHECK_FALSE(ray_segment({0.0f, 0.0f}, {1.0f, 0.0f}, collinear));
    CHECK_FALSE(segment_segment({0.0f, 0.0f}, {20.0f, 0.0f}, collinear));
}

TEST_CASE("ray_segment ignores segments behind the origin") {
    Segment s{{-10.0f, -5.0f}, {-10.0f, 5.0f}};
    CHECK_FALSE(ray_segment({0.0f, 0.0f}, {1.0f, 0.0f}, s));
    auto h = ray_segment({0.0f, 0.0f}, {-1.0f, 0.0f}, s);
    REQUIRE(h);
    CHECK(h->t == doctest::Approx(10.0f));
}

TEST_CASE("angle helpers wrap across pi") {
    CHECK(wrap_angle(3.0f * PI / 2.0f) == doctest::Approx(-PI / 2.0f));
    CHECK(wrap_angle(-PI) == doctest::Approx(PI));
    CHECK(angle_in_sweep(-3.0f, 3.0f, 0.5f, 0.0f));
    CHECK_FALSE(angle_in_sweep(0.0f, 3.0f, 0.5f, 0.0f));
    CHECK(angle_in_sweep(2.95f, 3.0f, 0.5f, 0.1f));
}

TEST_CASE("capsule resolution pushes off a door leaf") {
    glm::vec2 c{50.0f, 4.0f};
    REQUIRE(circle_overlaps_capsule(c, 10.0f, {0.0f, 0.0f}, {100.0f, 0.0f}, 7.5f));
    CHECK(resolve_circle_capsule(c, 10.0f, {0.0f, 0.0f}, {100.0f, 0.0f}, 7.5f));
    CHECK_FALSE(circle_overlaps_capsule(c, 10.0f, {0.0f, 0.0f}, {100.0f, 0.0f}, 7.5f));
    CHECK(c.y > 4.0f);
}
