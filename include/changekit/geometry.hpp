#pragma once

#include "changekit/types.hpp"

#include <optional>
#include <vector>

namespace changekit {

    struct Point2 {
        double x = 0.0;
        double y = 0.0;
    };

    double distance(Point2 const &a, Point2 const &b);

    // Vertex chain of a geometry; outer ring for polygons
    std::vector<Point2> vertices(Geometry const &g);

    bool isLineLike(Geometry const &g);

    // Mean of all vertices. nullopt for empty or degenerate geometry
    // (line under 2 vertices, ring under 3, non-finite coordinates)
    std::optional<Point2> centroid(Geometry const &g);

    double approxLength(Geometry const &g);

    // Line: angle from first to last vertex. Polygon: angle of the longest
    // edge, first one on ties. Degrees in (-180, 180].
    std::optional<double> bearing(Geometry const &g);

    // Absolute bearing difference with direction ignored, in [0, 90]
    double bearingDifference(double a, double b);

    struct FeatureMetrics {
        std::optional<Point2> centroid;
        double length = 0.0;
        std::optional<double> bearing;
        bool lineLike = false;
    };

    FeatureMetrics measure(Feature const &f);

    std::vector<FeatureMetrics> measure(FeatureCollection const &fc);

} // namespace changekit
