#pragma once

#include "changekit/changekit.hpp"

#include <atomic>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fixtures {

    using XY = std::pair<double, double>;

    inline ck::Feature line(std::string id, std::vector<XY> const &pts, ck::Properties props = {}) {
        std::vector<dp::Point> v;
        for (auto const &p : pts)
            v.push_back(dp::Point{p.first, p.second, 0.0});
        if (v.size() == 2)
            return ck::Feature{std::move(id), dp::Segment{v[0], v[1]}, std::move(props)};
        return ck::Feature{std::move(id), v, std::move(props)};
    }

    inline ck::Feature polygon(std::string id, std::vector<XY> const &ring, ck::Properties props = {}) {
        std::vector<dp::Point> v;
        for (auto const &p : ring)
            v.push_back(dp::Point{p.first, p.second, 0.0});
        return ck::Feature{std::move(id), dp::Polygon{dp::Vector<dp::Point>{v.begin(), v.end()}}, std::move(props)};
    }

    inline ck::FeatureCollection collection(std::vector<ck::Feature> features, int year = 0,
                                            std::string kind = "polygons") {
        ck::FeatureCollection fc;
        fc.features = std::move(features);
        fc.kind = std::move(kind);
        fc.year = year;
        return fc;
    }

    // `count` short vertical lines spaced `spacing` apart, each shifted by dx(i) along x
    template <typename Shift>
    ck::FeatureCollection grid(std::size_t count, double spacing, Shift dx, std::string const &prefix = "f") {
        std::vector<ck::Feature> out;
        for (std::size_t i = 0; i < count; ++i) {
            const double x = static_cast<double>(i) * spacing + dx(i);
            out.push_back(line(prefix + std::to_string(i), {{x, 0.0}, {x, 0.01}}, {{"f_type", "sidewalk"}}));
        }
        return collection(std::move(out));
    }

    inline ck::FeatureCollection grid(std::size_t count, double spacing, std::string const &prefix = "f") {
        return grid(count, spacing, [](std::size_t) { return 0.0; }, prefix);
    }

    // In-memory data source; counts collection loads to detect recomputation
    class MemoryDataSource : public ck::DataSource {
      public:
        std::optional<ck::Manifest> manifest;
        ck::ReferenceManifest referenceManifest;
        std::map<std::pair<std::string, int>, ck::FeatureCollection> collections;
        std::map<int, ck::FeatureCollection> references;
        mutable std::atomic<int> loads{0};

        void put(int year, ck::FeatureCollection fc, std::string const &kind = "polygons") {
            fc.kind = kind;
            fc.year = year;
            collections[{kind, year}] = std::move(fc);
        }

        std::optional<ck::Manifest> loadManifest() const override { return manifest; }

        std::optional<ck::FeatureCollection> loadFeatureCollection(std::string const &kind, int year) const override {
            ++loads;
            auto it = collections.find({kind, year});
            if (it == collections.end())
                return std::nullopt;
            return it->second;
        }

        std::optional<ck::FeatureCollection> loadReferenceCollection(int year) const override {
            ++loads;
            auto it = references.find(year);
            if (it == references.end())
                return std::nullopt;
            return it->second;
        }

        ck::ReferenceManifest loadReferenceManifest() const override { return referenceManifest; }
    };

} // namespace fixtures
