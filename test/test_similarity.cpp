#include <doctest/doctest.h>

#include "fixtures.hpp"

#include <cmath>

TEST_CASE("Similarity - Centroid distance gate") {
    auto t = ck::defaultTolerance();
    auto a = fixtures::line("a", {{0, 0}, {0, 0.01}});
    auto near = fixtures::line("b", {{0.002, 0}, {0.002, 0.01}});
    auto far = fixtures::line("c", {{0.003, 0}, {0.003, 0.01}});

    CHECK(ck::isSimilar(a, a, t));
    CHECK(ck::isSimilar(a, near, t));
    CHECK_FALSE(ck::isSimilar(a, far, t));
}

TEST_CASE("Similarity - Length ratio gate") {
    auto t = ck::defaultTolerance();
    auto full = fixtures::line("a", {{0, -0.001}, {0, 0.001}});
    auto half = fixtures::line("b", {{0, -0.0005}, {0, 0.0005}});
    auto most = fixtures::line("c", {{0, -0.0008}, {0, 0.0008}});

    CHECK_FALSE(ck::isSimilar(full, half, t));
    CHECK(ck::isSimilar(full, most, t));

    t.lengthRatio = 0.6;
    CHECK(ck::isSimilar(full, half, t));
}

TEST_CASE("Similarity - Angle gate ignores direction") {
    auto t = ck::defaultTolerance();
    const double c = std::cos(30.0 * 3.14159265358979323846 / 180.0) * 0.001;
    const double s = std::sin(30.0 * 3.14159265358979323846 / 180.0) * 0.001;

    auto flat = fixtures::line("a", {{-0.001, 0}, {0.001, 0}});
    auto tilted = fixtures::line("b", {{-c, -s}, {c, s}});
    auto reversed = fixtures::line("c", {{0.001, 0}, {-0.001, 0}});

    CHECK_FALSE(ck::isSimilar(flat, tilted, t));
    CHECK(ck::isSimilar(flat, reversed, t));

    t.angleDegrees = 45.0;
    CHECK(ck::isSimilar(flat, tilted, t));
}

TEST_CASE("Similarity - Polygons skip the length check") {
    const double a = 0.0001;
    const double b = 0.0002;
    auto small = fixtures::polygon("s", {{-a, -a}, {a, -a}, {a, a}, {-a, a}, {-a, -a}});
    auto large = fixtures::polygon("l", {{-b, -b}, {b, -b}, {b, b}, {-b, b}, {-b, -b}});
    CHECK(ck::isSimilar(small, large, ck::defaultTolerance()));
}

TEST_CASE("Similarity - Undefined bearing and centroid") {
    auto t = ck::defaultTolerance();
    ck::Feature point{"p", dp::Point{0.0, 0.005, 0.0}, {}};
    auto line = fixtures::line("l", {{0, 0}, {0, 0.01}});
    CHECK(ck::isSimilar(point, line, t));

    ck::Feature empty{"e", std::vector<dp::Point>{}, {}};
    CHECK_FALSE(ck::isSimilar(empty, line, t));
    CHECK_FALSE(ck::isSimilar(empty, empty, t));
}
