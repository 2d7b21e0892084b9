#include <doctest/doctest.h>

#include "fixtures.hpp"

#include <limits>

TEST_CASE("SpatialIndex - Cell keys and radius") {
    ck::SpatialIndex index(fixtures::collection({}));
    CHECK(index.scale() == doctest::Approx(200.0));

    auto k = index.keyFor(ck::Point2{0.0124, -0.0001});
    CHECK(k.x == 2);
    CHECK(k.y == -1);

    CHECK(index.radiusFor(0.0025) == 1);
    CHECK(index.radiusFor(0.02) == 4);
    CHECK(index.radiusFor(0.0) == 1);
    CHECK(index.radiusFor(0.0001) == 1);

    ck::SpatialIndex fine(fixtures::collection({}), 1000.0);
    CHECK(fine.radiusFor(0.0025) == 3);
}

TEST_CASE("SpatialIndex - Query neighbourhood") {
    // Centroids at (0.001, 0.003), (0.006, 0.003) and (0.5, 0.503)
    auto fc = fixtures::collection({
        fixtures::line("a", {{0.001, 0.0}, {0.001, 0.006}}),
        fixtures::line("b", {{0.006, 0.0}, {0.006, 0.006}}),
        fixtures::line("c", {{0.5, 0.5}, {0.5, 0.506}}),
        ck::Feature{"empty", std::vector<dp::Point>{}, {}},
    });
    ck::SpatialIndex index(fc);

    CHECK(index.indexedCount() == 3);
    CHECK(index.cellCount() == 3);

    auto near = index.query(ck::Point2{0.001, 0.003}, 1);
    REQUIRE(near.size() == 2);
    CHECK(near[0] == 0);
    CHECK(near[1] == 1);

    auto self = index.query(ck::Point2{0.001, 0.003}, 0);
    REQUIRE(self.size() == 1);
    CHECK(self[0] == 0);

    CHECK(index.query(ck::Point2{0.25, 0.25}, 1).empty());
}

TEST_CASE("SpatialIndex - Same cell keeps insertion order") {
    auto fc = fixtures::collection({
        fixtures::line("a", {{0.0001, 0.0}, {0.0001, 0.001}}),
        fixtures::line("b", {{0.0002, 0.0}, {0.0002, 0.001}}),
        fixtures::line("c", {{0.0003, 0.0}, {0.0003, 0.001}}),
    });
    ck::SpatialIndex index(fc);
    CHECK(index.cellCount() == 1);

    auto hits = index.query(ck::Point2{0.0002, 0.0005}, 1);
    REQUIRE(hits.size() == 3);
    CHECK(hits[0] == 0);
    CHECK(hits[1] == 1);
    CHECK(hits[2] == 2);
}

TEST_CASE("SpatialIndex - Very large search distance") {
    auto before = fixtures::collection({fixtures::line("a", {{0.0, 0.0}, {0.0, 0.01}})});
    auto after = fixtures::collection({fixtures::line("a", {{0.5, 0.0}, {0.5, 0.01}})});
    ck::SpatialIndex index(before);

    CHECK(index.radiusFor(1e8) == 20000000000LL);
    CHECK(index.radiusFor(1e12) == ck::SpatialIndex::kMaxRadius);
    CHECK(index.radiusFor(2.0) == 400);
    CHECK(index.radiusFor(std::numeric_limits<double>::max()) == ck::SpatialIndex::kMaxRadius);

    auto hits = index.query(ck::Point2{0.5, 0.005}, index.radiusFor(1e8));
    REQUIRE(hits.size() == 1);
    CHECK(hits[0] == 0);

    const ck::Tolerance wide{1e8, 0.3, 15.0};
    CHECK_NOTHROW(ck::validate(wide));
    CHECK(ck::isSimilar(before.features[0], after.features[0], wide));
    CHECK(ck::greedyMatch(before, after, index, wide).size() == 1);

    const ck::Tolerance twoDegrees{2.0, 0.3, 15.0};
    CHECK(ck::greedyMatch(before, after, index, twoDegrees).size() == 1);
}

TEST_CASE("SpatialIndex - Wide window visits occupied cells in grid order") {
    // Cells (1,-1), (-1,1) and (0,0) in that insertion order
    std::vector<ck::Feature> local{
        fixtures::line("p", {{0.0075, -0.0049}, {0.0075, -0.0001}}),
        fixtures::line("q", {{-0.0025, 0.0051}, {-0.0025, 0.0099}}),
        fixtures::line("r", {{0.0025, 0.0001}, {0.0025, 0.0049}}),
    };
    const ck::Point2 center{0.0025, 0.0025};

    ck::SpatialIndex sparse(fixtures::collection(local));
    REQUIRE(sparse.cellCount() == 3);
    auto fromOccupied = sparse.query(center, 1);

    auto crowded = local;
    for (int i = 0; i < 10; ++i) {
        const double x = 1.0 + i * 0.1;
        crowded.push_back(fixtures::line("far" + std::to_string(i), {{x, 0.0}, {x, 0.004}}));
    }
    ck::SpatialIndex dense(fixtures::collection(crowded));
    REQUIRE(dense.cellCount() == 13);
    auto fromWindow = dense.query(center, 1);

    REQUIRE(fromOccupied.size() == 3);
    CHECK(fromOccupied[0] == 1);
    CHECK(fromOccupied[1] == 2);
    CHECK(fromOccupied[2] == 0);
    CHECK(fromOccupied == fromWindow);
}
