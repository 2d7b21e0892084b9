#pragma once

#include <datapod/datapod.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dp = ::datapod;

namespace changekit {
    // Coordinates are kept as read (longitude, latitude in degrees); z is unused
    // Segment is a two-vertex LineString, std::vector<dp::Point> a longer one
    using Geometry = std::variant<dp::Point, dp::Segment, std::vector<dp::Point>, dp::Polygon>;

    using Properties = std::unordered_map<std::string, std::string>;

    enum class Category { Sidewalk, Crosswalk, Road, Unknown };

    enum class Status { Added, Removed, Unchanged };

    enum class ValidationStatus { TruePositive, FalsePositive, FalseNegative };

    struct Feature {
        std::string id;
        Geometry geometry;
        Properties properties;
    };

    struct FeatureCollection {
        std::vector<Feature> features;
        Properties global_properties;
        std::string kind; // "polygons", "network" or "reference"
        int year = 0;
    };

    // Thresholds gating whether two features are the same real-world object.
    // distance is in coordinate units, lengthRatio bounds 1 - min/max length,
    // angleDegrees bounds the folded bearing difference.
    struct Tolerance {
        double distance = 0.0025;
        double lengthRatio = 0.3;
        double angleDegrees = 15.0;
    };

    inline bool operator==(Tolerance const &a, Tolerance const &b) {
        return a.distance == b.distance && a.lengthRatio == b.lengthRatio && a.angleDegrees == b.angleDegrees;
    }

    inline bool operator!=(Tolerance const &a, Tolerance const &b) { return !(a == b); }

    // Throws std::invalid_argument unless every field is finite and in range
    void validate(Tolerance const &t);

    Tolerance defaultTolerance();

    Tolerance defaultValidationTolerance();

    Category category(Feature const &f);

    // Raw f_type / class value, "infrastructure" when neither is set
    std::string typeLabel(Feature const &f);

    std::optional<double> measuredLength(Feature const &f);

    std::optional<int> captureYear(Feature const &f);

    const char *toString(Category c);
    const char *toString(Status s);
    const char *toString(ValidationStatus s);

    std::optional<Category> parseCategory(std::string const &s);

} // namespace changekit
