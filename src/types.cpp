#include "changekit/types.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace changekit {

    namespace {
        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        const std::string *findProperty(Feature const &f, const char *key) {
            auto it = f.properties.find(key);
            if (it == f.properties.end() || it->second.empty() || it->second == "null")
                return nullptr;
            return &it->second;
        }

        std::optional<double> toNumber(std::string const &s) {
            // Non-string JSON values are stored serialized, strings may carry quotes from hand-made input
            std::string v = s;
            if (v.size() >= 2 && v.front() == '"' && v.back() == '"')
                v = v.substr(1, v.size() - 2);
            try {
                std::size_t used = 0;
                double d = std::stod(v, &used);
                if (used == 0 || !std::isfinite(d))
                    return std::nullopt;
                return d;
            } catch (std::exception const &) {
                return std::nullopt;
            }
        }
    } // namespace

    void validate(Tolerance const &t) {
        if (!std::isfinite(t.distance) || t.distance < 0.0)
            throw std::invalid_argument("changekit::validate(): tolerance distance must be finite and >= 0");
        if (!std::isfinite(t.lengthRatio) || t.lengthRatio < 0.0 || t.lengthRatio > 1.0)
            throw std::invalid_argument("changekit::validate(): tolerance lengthRatio must be in [0, 1]");
        if (!std::isfinite(t.angleDegrees) || t.angleDegrees < 0.0 || t.angleDegrees > 180.0)
            throw std::invalid_argument("changekit::validate(): tolerance angleDegrees must be in [0, 180]");
    }

    Tolerance defaultTolerance() { return Tolerance{0.0025, 0.3, 15.0}; }

    // Reference data comes from a different vintage and survey process, so it
    // is matched with a tight position gate but looser shape checks
    Tolerance defaultValidationTolerance() { return Tolerance{0.0001, 0.4, 20.0}; }

    std::optional<Category> parseCategory(std::string const &s) {
        auto v = lower(s);
        if (v.find("crosswalk") != std::string::npos)
            return Category::Crosswalk;
        if (v.find("sidewalk") != std::string::npos)
            return Category::Sidewalk;
        if (v.find("road") != std::string::npos)
            return Category::Road;
        if (v == "unknown")
            return Category::Unknown;
        return std::nullopt;
    }

    Category category(Feature const &f) {
        for (const char *key : {"f_type", "class", "type"}) {
            if (auto *v = findProperty(f, key)) {
                if (auto c = parseCategory(*v))
                    return *c;
            }
        }
        return Category::Unknown;
    }

    std::string typeLabel(Feature const &f) {
        if (auto *v = findProperty(f, "f_type"))
            return *v;
        if (auto *v = findProperty(f, "class"))
            return *v;
        return "infrastructure";
    }

    std::optional<double> measuredLength(Feature const &f) {
        auto *v = findProperty(f, "length");
        if (!v)
            return std::nullopt;
        return toNumber(*v);
    }

    std::optional<int> captureYear(Feature const &f) {
        auto *v = findProperty(f, "year");
        if (!v)
            return std::nullopt;
        auto d = toNumber(*v);
        if (!d || !(*d >= std::numeric_limits<int>::min() && *d <= std::numeric_limits<int>::max()))
            return std::nullopt;
        return static_cast<int>(*d);
    }

    const char *toString(Category c) {
        switch (c) {
        case Category::Sidewalk:
            return "sidewalk";
        case Category::Crosswalk:
            return "crosswalk";
        case Category::Road:
            return "road";
        case Category::Unknown:
            break;
        }
        return "unknown";
    }

    const char *toString(Status s) {
        switch (s) {
        case Status::Added:
            return "added";
        case Status::Removed:
            return "removed";
        case Status::Unchanged:
            break;
        }
        return "unchanged";
    }

    const char *toString(ValidationStatus s) {
        switch (s) {
        case ValidationStatus::TruePositive:
            return "true_positive";
        case ValidationStatus::FalsePositive:
            return "false_positive";
        case ValidationStatus::FalseNegative:
            break;
        }
        return "false_negative";
    }

} // namespace changekit
