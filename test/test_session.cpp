#include <doctest/doctest.h>

#include "fixtures.hpp"

#include <memory>

TEST_CASE("Session - Tolerance versioning") {
    ck::Session session;
    CHECK(session.getTolerance() == ck::defaultTolerance());
    CHECK(session.toleranceVersion() == 0);

    auto t = ck::defaultTolerance();
    t.distance = 0.005;
    CHECK(session.setTolerance(t) == 1);
    CHECK(session.toleranceVersion() == 1);
    CHECK(session.getTolerance() == t);

    // Same value still counts as a change
    CHECK(session.setTolerance(t) == 2);

    SUBCASE("Invalid tolerance leaves state untouched") {
        CHECK_THROWS_AS(session.setTolerance(ck::Tolerance{0.001, 2.0, 15.0}), std::invalid_argument);
        CHECK(session.toleranceVersion() == 2);
        CHECK(session.getTolerance() == t);
    }

    CHECK_THROWS_AS(ck::Session(ck::Tolerance{-0.1, 0.3, 15.0}), std::invalid_argument);
}

TEST_CASE("Session - Cache keyed by years and version") {
    ck::Session session;
    auto r = std::make_shared<ck::ComparisonResult>();
    r->beforeYear = 2014;
    r->afterYear = 2016;

    CHECK_FALSE(session.cached(2014, 2016));
    session.store(2014, 2016, r);
    CHECK(session.cached(2014, 2016).get() == r.get());
    CHECK_FALSE(session.cached(2016, 2014));
    CHECK(session.cacheSize() == 1);

    session.setTolerance(ck::Tolerance{0.003, 0.3, 15.0});
    CHECK_FALSE(session.cached(2014, 2016));
    CHECK(session.cacheSize() == 1);

    auto r2 = std::make_shared<ck::ComparisonResult>();
    session.store(2014, 2016, r2);
    CHECK(session.cacheSize() == 2);
    CHECK(session.cached(2014, 2016).get() == r2.get());

    CHECK(session.evictStale() == 1);
    CHECK(session.cacheSize() == 1);
    CHECK(session.cached(2014, 2016).get() == r2.get());

    session.clearCache();
    CHECK(session.cacheSize() == 0);
}
