#pragma once

#include "changekit/geometry.hpp"
#include "changekit/spatial_index.hpp"
#include "changekit/types.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace changekit {

    // Order in which "after" features claim candidates. The matcher is greedy,
    // so a different order can pick a different (similar sized) subset.
    enum class MatchOrder { Collection, ById };

    struct MatchResult {
        std::vector<std::pair<std::size_t, std::size_t>> pairs; // (before, after), in claim order
        std::vector<bool> claimedBefore;
        std::vector<bool> claimedAfter;

        std::size_t size() const { return pairs.size(); }
        bool isBeforeClaimed(std::size_t i) const { return i < claimedBefore.size() && claimedBefore[i]; }
        bool isAfterClaimed(std::size_t i) const { return i < claimedAfter.size() && claimedAfter[i]; }
    };

    // Iteration order over the "after" side for the given policy
    std::vector<std::size_t> iterationOrder(FeatureCollection const &after, MatchOrder order);

    // One-to-one greedy correspondence. Each "after" feature takes the first
    // unclaimed candidate from the index that passes isSimilar. No backtracking.
    MatchResult greedyMatch(std::vector<FeatureMetrics> const &before, std::vector<FeatureMetrics> const &after,
                            SpatialIndex const &beforeIndex, Tolerance const &tolerance,
                            std::vector<std::size_t> const &afterOrder);

    MatchResult greedyMatch(FeatureCollection const &before, FeatureCollection const &after,
                            SpatialIndex const &beforeIndex, Tolerance const &tolerance,
                            MatchOrder order = MatchOrder::Collection);

} // namespace changekit
