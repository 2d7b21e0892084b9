#pragma once

#include "changekit/geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace changekit {

    struct CellKey {
        std::int64_t x = 0;
        std::int64_t y = 0;

        bool operator==(CellKey const &o) const { return x == o.x && y == o.y; }
    };

    struct CellKeyHash {
        std::size_t operator()(CellKey const &k) const noexcept {
            auto h = static_cast<std::uint64_t>(k.x) * 0x9E3779B97F4A7C15ULL;
            h ^= static_cast<std::uint64_t>(k.y) + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
            return static_cast<std::size_t>(h);
        }
    };

    // Uniform grid over feature centroids. A cell is 1/scale coordinate units
    // wide. Features without a centroid are left out and can never be matched.
    class SpatialIndex {
      public:
        static constexpr double kDefaultScale = 200.0;

        explicit SpatialIndex(std::vector<FeatureMetrics> const &metrics, double scale = kDefaultScale);
        explicit SpatialIndex(FeatureCollection const &fc, double scale = kDefaultScale);

        CellKey keyFor(Point2 const &p) const;

        static constexpr std::int64_t kMaxRadius = std::int64_t{1} << 40;

        // Cell radius covering a search distance, in [1, kMaxRadius]
        std::int64_t radiusFor(double distance) const;

        // Indices bucketed in the (2r+1)^2 cells around p, cells visited dx
        // outer and dy inner, bucket order kept. Windows larger than the
        // number of occupied cells are answered from the occupied cells.
        std::vector<std::size_t> query(Point2 const &p, std::int64_t radiusCells) const;

        std::size_t indexedCount() const { return indexed_; }
        std::size_t cellCount() const { return cells_.size(); }
        double scale() const { return scale_; }

      private:
        void build(std::vector<FeatureMetrics> const &metrics);

        double scale_;
        std::size_t indexed_ = 0;
        std::unordered_map<CellKey, std::vector<std::size_t>, CellKeyHash> cells_;
    };

} // namespace changekit
