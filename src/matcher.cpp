#include "changekit/matcher.hpp"
#include "changekit/similarity.hpp"

#include <algorithm>
#include <numeric>

namespace changekit {

    std::vector<std::size_t> iterationOrder(FeatureCollection const &after, MatchOrder order) {
        std::vector<std::size_t> idx(after.features.size());
        std::iota(idx.begin(), idx.end(), std::size_t{0});
        if (order == MatchOrder::ById) {
            std::stable_sort(idx.begin(), idx.end(), [&](std::size_t a, std::size_t b) {
                return after.features[a].id < after.features[b].id;
            });
        }
        return idx;
    }

    MatchResult greedyMatch(std::vector<FeatureMetrics> const &before, std::vector<FeatureMetrics> const &after,
                            SpatialIndex const &beforeIndex, Tolerance const &tolerance,
                            std::vector<std::size_t> const &afterOrder) {
        MatchResult result;
        result.claimedBefore.assign(before.size(), false);
        result.claimedAfter.assign(after.size(), false);

        const auto radius = beforeIndex.radiusFor(tolerance.distance);

        for (auto ai : afterOrder) {
            if (ai >= after.size() || result.claimedAfter[ai])
                continue;
            auto const &a = after[ai];
            if (!a.centroid)
                continue;

            for (auto bi : beforeIndex.query(*a.centroid, radius)) {
                if (bi >= before.size() || result.claimedBefore[bi])
                    continue;
                if (isSimilar(a, before[bi], tolerance)) {
                    result.claimedBefore[bi] = true;
                    result.claimedAfter[ai] = true;
                    result.pairs.emplace_back(bi, ai);
                    break;
                }
            }
        }
        return result;
    }

    MatchResult greedyMatch(FeatureCollection const &before, FeatureCollection const &after,
                            SpatialIndex const &beforeIndex, Tolerance const &tolerance, MatchOrder order) {
        return greedyMatch(measure(before), measure(after), beforeIndex, tolerance, iterationOrder(after, order));
    }

} // namespace changekit
