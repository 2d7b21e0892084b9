#pragma once

#include "changekit/geometry.hpp"
#include "changekit/types.hpp"

namespace changekit {

    // Hard gate, all three checks must pass:
    //  - centroid distance within tolerance.distance
    //  - for two line-like features, 1 - min/max length within tolerance.lengthRatio
    //  - folded bearing difference within tolerance.angleDegrees (skipped if a bearing is undefined)
    bool isSimilar(FeatureMetrics const &a, FeatureMetrics const &b, Tolerance const &tolerance);

    bool isSimilar(Feature const &a, Feature const &b, Tolerance const &tolerance);

} // namespace changekit
