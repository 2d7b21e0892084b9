#include "changekit/similarity.hpp"

#include <algorithm>

namespace changekit {

    bool isSimilar(FeatureMetrics const &a, FeatureMetrics const &b, Tolerance const &tolerance) {
        if (!a.centroid || !b.centroid)
            return false;
        if (distance(*a.centroid, *b.centroid) > tolerance.distance)
            return false;

        if (a.lineLike && b.lineLike) {
            const double maxLen = std::max(a.length, b.length);
            const double minLen = std::min(a.length, b.length);
            if (maxLen > 0.0 && (1.0 - minLen / maxLen) > tolerance.lengthRatio)
                return false;
        }

        if (a.bearing && b.bearing && bearingDifference(*a.bearing, *b.bearing) > tolerance.angleDegrees)
            return false;

        return true;
    }

    bool isSimilar(Feature const &a, Feature const &b, Tolerance const &tolerance) {
        return isSimilar(measure(a), measure(b), tolerance);
    }

} // namespace changekit
