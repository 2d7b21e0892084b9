#include "changekit/spatial_index.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace changekit {

    namespace {
        // Cell coordinates are kept well inside int64 so window arithmetic cannot overflow
        constexpr double kMaxCell = 4.0e15;

        std::int64_t cellOf(double scaled) {
            return static_cast<std::int64_t>(std::clamp(std::floor(scaled), -kMaxCell, kMaxCell));
        }
    } // namespace

    SpatialIndex::SpatialIndex(std::vector<FeatureMetrics> const &metrics, double scale) : scale_(scale) {
        if (!std::isfinite(scale) || scale <= 0.0)
            throw std::invalid_argument("changekit::SpatialIndex(): scale must be positive");
        build(metrics);
    }

    SpatialIndex::SpatialIndex(FeatureCollection const &fc, double scale) : SpatialIndex(measure(fc), scale) {}

    void SpatialIndex::build(std::vector<FeatureMetrics> const &metrics) {
        std::size_t skipped = 0;
        for (std::size_t i = 0; i < metrics.size(); ++i) {
            if (!metrics[i].centroid) {
                ++skipped;
                continue;
            }
            cells_[keyFor(*metrics[i].centroid)].push_back(i);
            ++indexed_;
        }
        if (skipped > 0)
            spdlog::debug("[SpatialIndex] {} of {} features have no centroid and were not indexed", skipped,
                          metrics.size());
    }

    CellKey SpatialIndex::keyFor(Point2 const &p) const {
        return CellKey{cellOf(p.x * scale_), cellOf(p.y * scale_)};
    }

    std::int64_t SpatialIndex::radiusFor(double distance) const {
        if (!std::isfinite(distance) || distance <= 0.0)
            return 1;
        const double cells = std::ceil(distance * scale_);
        if (!(cells < static_cast<double>(kMaxRadius)))
            return kMaxRadius;
        return std::max<std::int64_t>(1, static_cast<std::int64_t>(cells));
    }

    std::vector<std::size_t> SpatialIndex::query(Point2 const &p, std::int64_t radiusCells) const {
        std::vector<std::size_t> out;
        if (cells_.empty())
            return out;

        const std::int64_t r = std::clamp<std::int64_t>(radiusCells, 0, kMaxRadius);
        const auto center = keyFor(p);

        const double side = 2.0 * static_cast<double>(r) + 1.0;
        if (side * side > static_cast<double>(cells_.size())) {
            std::vector<CellKey const *> hits;
            for (auto const &cell : cells_) {
                if (std::abs(cell.first.x - center.x) <= r && std::abs(cell.first.y - center.y) <= r)
                    hits.push_back(&cell.first);
            }
            std::sort(hits.begin(), hits.end(), [](CellKey const *a, CellKey const *b) {
                return a->x != b->x ? a->x < b->x : a->y < b->y;
            });
            for (auto const *key : hits) {
                auto const &bucket = cells_.at(*key);
                out.insert(out.end(), bucket.begin(), bucket.end());
            }
            return out;
        }

        for (std::int64_t dx = -r; dx <= r; ++dx) {
            for (std::int64_t dy = -r; dy <= r; ++dy) {
                auto it = cells_.find(CellKey{center.x + dx, center.y + dy});
                if (it != cells_.end())
                    out.insert(out.end(), it->second.begin(), it->second.end());
            }
        }
        return out;
    }

} // namespace changekit
