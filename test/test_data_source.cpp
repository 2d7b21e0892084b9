#include <doctest/doctest.h>

#include "fixtures.hpp"
#include <filesystem>
#include <fstream>

namespace {
    const char *kLine = R"({"type": "FeatureCollection", "features": [
        {"type": "Feature", "id": "a", "properties": {"f_type": "sidewalk"},
         "geometry": {"type": "LineString", "coordinates": [[0, 0], [0, 0.01]]}}
    ]})";

    const char *kTwoLines = R"({"type": "FeatureCollection", "features": [
        {"type": "Feature", "id": "a", "geometry": {"type": "LineString", "coordinates": [[0, 0], [0, 0.01]]}},
        {"type": "Feature", "id": "b", "geometry": {"type": "LineString", "coordinates": [[1, 0], [1, 0.01]]}}
    ]})";

    void writeFile(std::filesystem::path const &path, std::string const &content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream ofs(path);
        ofs << content;
    }

    struct TempDir {
        std::filesystem::path path;

        explicit TempDir(std::string const &name) : path(std::filesystem::temp_directory_path() / name) {
            std::filesystem::remove_all(path);
            std::filesystem::create_directories(path);
        }
        ~TempDir() { std::filesystem::remove_all(path); }
    };
} // namespace

TEST_CASE("DataSource - Manifest") {
    TempDir dir("changekit_test_manifest");
    ck::FileDataSource source(dir.path);

    SUBCASE("Missing manifest") { CHECK_FALSE(source.loadManifest().has_value()); }

    SUBCASE("Full manifest") {
        writeFile(dir.path / "manifest.json", R"({
            "name": "downtown",
            "years": [2018, 2014, 2016, 2014],
            "location": {"center": [-122.33, 47.60], "zoom": 15}
        })");
        auto m = source.loadManifest();
        REQUIRE(m.has_value());
        CHECK(m->name == "downtown");
        REQUIRE(m->years.size() == 3);
        CHECK(m->years[0] == 2014);
        CHECK(m->years[2] == 2018);
        CHECK(m->center[0] == doctest::Approx(-122.33));
        CHECK(m->center[1] == doctest::Approx(47.60));
        CHECK(m->zoom == doctest::Approx(15.0));
    }

    SUBCASE("Malformed manifest throws") {
        writeFile(dir.path / "manifest.json", R"({"years": "2014"})");
        CHECK_THROWS_AS(source.loadManifest(), std::runtime_error);
    }

    SUBCASE("Year outside the integer range throws") {
        writeFile(dir.path / "manifest.json", R"({"years": [2014, 1e20]})");
        CHECK_THROWS_WITH(source.loadManifest(), "changekit::FileDataSource::loadManifest(): year out of range");
    }
}

TEST_CASE("DataSource - Feature collections by kind and year") {
    TempDir dir("changekit_test_collections");
    writeFile(dir.path / "polygons_2014.geojson", kLine);
    writeFile(dir.path / "network_2014.geojson", kTwoLines);
    writeFile(dir.path / "network_2016.geojson", kTwoLines);
    ck::FileDataSource source(dir.path);

    auto polygons = source.loadFeatureCollection("polygons", 2014);
    REQUIRE(polygons.has_value());
    CHECK(polygons->kind == "polygons");
    CHECK(polygons->year == 2014);
    CHECK(polygons->features.size() == 1);

    CHECK_FALSE(source.loadFeatureCollection("polygons", 2016).has_value());
    CHECK_THROWS_AS(source.loadFeatureCollection("buildings", 2014), std::invalid_argument);

    SUBCASE("Loader prefers polygons and falls back to network") {
        ck::DataLoader loader(source);
        auto y2014 = loader.loadYear(2014);
        REQUIRE(y2014);
        CHECK(y2014->kind == "polygons");

        auto y2016 = loader.loadYear(2016);
        REQUIRE(y2016);
        CHECK(y2016->kind == "network");
        CHECK(y2016->features.size() == 2);

        CHECK_FALSE(loader.loadYear(2020));
        CHECK(loader.memoSize() == 2);

        // Memo hit hands back the same collection
        auto again = loader.fetchYear(2014);
        CHECK(again.get().get() == y2014.get());

        loader.clear();
        CHECK(loader.memoSize() == 0);
    }

    SUBCASE("Network loading skips polygons") {
        ck::DataLoader loader(source);
        auto network = loader.loadNetwork(2014);
        REQUIRE(network);
        CHECK(network->kind == "network");
        CHECK(network->features.size() == 2);

        auto year = loader.loadYear(2014);
        REQUIRE(year);
        CHECK(year->kind == "polygons");
        CHECK(loader.memoSize() == 2);

        writeFile(dir.path / "polygons_2020.geojson", kLine);
        CHECK_FALSE(loader.loadNetwork(2020));
    }

    SUBCASE("Both years fetched concurrently") {
        ck::DataLoader loader(source);
        auto a = loader.fetchYear(2014);
        auto b = loader.fetchYear(2016);
        auto first = loader.takeYear(2014, a);
        auto second = loader.takeYear(2016, b);
        CHECK(first);
        CHECK(second);
        CHECK(loader.memoSize() == 2);
    }

    SUBCASE("Malformed collection surfaces through the future") {
        writeFile(dir.path / "polygons_2018.geojson", "{ not json");
        ck::DataLoader loader(source);
        CHECK_THROWS_AS(loader.loadYear(2018), std::runtime_error);
        CHECK(loader.memoSize() == 0);
    }
}

TEST_CASE("DataSource - Reference data") {
    TempDir dir("changekit_test_reference");
    ck::FileDataSource source(dir.path);

    CHECK(source.loadReferenceManifest().availableYears.empty());
    CHECK_FALSE(source.loadReferenceCollection(2014).has_value());

    writeFile(dir.path / "reference" / "manifest.json", R"({"name": "planimetrics", "available_years": [2014, 1996]})");
    writeFile(dir.path / "reference" / "planimetrics_2014.geojson", kTwoLines);

    auto m = source.loadReferenceManifest();
    CHECK(m.name == "planimetrics");
    REQUIRE(m.availableYears.size() == 2);
    CHECK(m.availableYears[0] == 1996);

    auto ref = source.loadReferenceCollection(2014);
    REQUIRE(ref.has_value());
    CHECK(ref->kind == "reference");
    CHECK(ref->year == 2014);

    ck::DataLoader loader(source);
    auto shared = loader.loadReference(2014);
    REQUIRE(shared);
    CHECK(shared->features.size() == 2);
    CHECK_FALSE(loader.loadReference(2004));

    SUBCASE("Camel case key") {
        writeFile(dir.path / "reference" / "manifest.json", R"({"availableYears": [2022]})");
        auto camel = source.loadReferenceManifest();
        REQUIRE(camel.availableYears.size() == 1);
        CHECK(camel.availableYears[0] == 2022);
    }
}

TEST_CASE("DataSource - Enabled years") {
    auto years = ck::enabledYears({2018, 2014, 2016, 2014, 2020}, {2016, 1999});
    REQUIRE(years.size() == 3);
    CHECK(years[0] == 2014);
    CHECK(years[1] == 2018);
    CHECK(years[2] == 2020);

    CHECK(ck::enabledYears({2014}, {2014}).empty());
}
