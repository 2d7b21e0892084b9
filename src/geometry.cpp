#include "changekit/geometry.hpp"

#include <cmath>
#include <type_traits>

namespace changekit {

    namespace {
        constexpr double kPi = 3.14159265358979323846;
        constexpr double kRadToDeg = 180.0 / kPi;

        Point2 toPoint2(dp::Point const &p) { return Point2{p.x, p.y}; }

        bool isDegenerate(Geometry const &g, std::vector<Point2> const &pts) {
            if (pts.empty())
                return true;
            for (auto const &p : pts) {
                if (!std::isfinite(p.x) || !std::isfinite(p.y))
                    return true;
            }
            if (std::holds_alternative<dp::Polygon>(g))
                return pts.size() < 3;
            if (isLineLike(g))
                return pts.size() < 2;
            return false;
        }

        double angleOf(Point2 const &from, Point2 const &to) {
            return std::atan2(to.y - from.y, to.x - from.x) * kRadToDeg;
        }
    } // namespace

    double distance(Point2 const &a, Point2 const &b) {
        const double dx = a.x - b.x;
        const double dy = a.y - b.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    std::vector<Point2> vertices(Geometry const &g) {
        return std::visit(
            [](auto const &shape) -> std::vector<Point2> {
                using T = std::decay_t<decltype(shape)>;
                std::vector<Point2> out;
                if constexpr (std::is_same_v<T, dp::Point>) {
                    out.push_back(toPoint2(shape));
                } else if constexpr (std::is_same_v<T, dp::Segment>) {
                    out.push_back(toPoint2(shape.start));
                    out.push_back(toPoint2(shape.end));
                } else if constexpr (std::is_same_v<T, std::vector<dp::Point>>) {
                    out.reserve(shape.size());
                    for (auto const &p : shape)
                        out.push_back(toPoint2(p));
                } else if constexpr (std::is_same_v<T, dp::Polygon>) {
                    for (auto const &p : shape.vertices)
                        out.push_back(toPoint2(p));
                }
                return out;
            },
            g);
    }

    bool isLineLike(Geometry const &g) {
        return std::holds_alternative<dp::Segment>(g) || std::holds_alternative<std::vector<dp::Point>>(g);
    }

    std::optional<Point2> centroid(Geometry const &g) {
        auto pts = vertices(g);
        if (isDegenerate(g, pts))
            return std::nullopt;

        double sumX = 0.0, sumY = 0.0;
        for (auto const &p : pts) {
            sumX += p.x;
            sumY += p.y;
        }
        const auto n = static_cast<double>(pts.size());
        return Point2{sumX / n, sumY / n};
    }

    double approxLength(Geometry const &g) {
        if (std::holds_alternative<dp::Point>(g))
            return 0.0;
        auto pts = vertices(g);
        double length = 0.0;
        for (std::size_t i = 1; i < pts.size(); ++i)
            length += distance(pts[i - 1], pts[i]);
        return std::isfinite(length) ? length : 0.0;
    }

    std::optional<double> bearing(Geometry const &g) {
        if (std::holds_alternative<dp::Point>(g))
            return std::nullopt;
        auto pts = vertices(g);
        if (isDegenerate(g, pts))
            return std::nullopt;

        if (!std::holds_alternative<dp::Polygon>(g))
            return angleOf(pts.front(), pts.back());

        // Longest edge stands in for the principal axis
        std::size_t best = 0;
        double bestLength = -1.0;
        for (std::size_t i = 1; i < pts.size(); ++i) {
            double len = distance(pts[i - 1], pts[i]);
            if (len > bestLength) {
                bestLength = len;
                best = i;
            }
        }
        return angleOf(pts[best - 1], pts[best]);
    }

    double bearingDifference(double a, double b) {
        double d = std::fmod(std::fabs(a - b), 180.0);
        if (d > 90.0)
            d = 180.0 - d;
        return d;
    }

    FeatureMetrics measure(Feature const &f) {
        FeatureMetrics m;
        m.centroid = centroid(f.geometry);
        m.length = approxLength(f.geometry);
        m.bearing = bearing(f.geometry);
        m.lineLike = isLineLike(f.geometry);
        return m;
    }

    std::vector<FeatureMetrics> measure(FeatureCollection const &fc) {
        std::vector<FeatureMetrics> out;
        out.reserve(fc.features.size());
        for (auto const &f : fc.features)
            out.push_back(measure(f));
        return out;
    }

} // namespace changekit
