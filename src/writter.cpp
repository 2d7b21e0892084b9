#include "changekit/writter.hpp"

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace changekit {

    namespace {
        boost::json::array ptCoords(dp::Point const &p) {
            boost::json::array arr;
            arr.push_back(p.x);
            arr.push_back(p.y);
            return arr;
        }

        boost::json::value geometryToJson(Geometry const &geom) {
            return std::visit(
                [&](auto const &shape) -> boost::json::value {
                    using T = std::decay_t<decltype(shape)>;
                    boost::json::object j;
                    if constexpr (std::is_same_v<T, dp::Point>) {
                        j["type"] = "Point";
                        j["coordinates"] = ptCoords(shape);
                    } else if constexpr (std::is_same_v<T, dp::Segment>) {
                        j["type"] = "LineString";
                        boost::json::array coords;
                        coords.push_back(ptCoords(shape.start));
                        coords.push_back(ptCoords(shape.end));
                        j["coordinates"] = std::move(coords);
                    } else if constexpr (std::is_same_v<T, std::vector<dp::Point>>) {
                        j["type"] = "LineString";
                        boost::json::array arr;
                        for (auto const &p : shape)
                            arr.push_back(ptCoords(p));
                        j["coordinates"] = std::move(arr);
                    } else if constexpr (std::is_same_v<T, dp::Polygon>) {
                        j["type"] = "Polygon";
                        boost::json::array rings;
                        boost::json::array ring;
                        for (auto const &p : shape.vertices)
                            ring.push_back(ptCoords(p));
                        rings.push_back(std::move(ring));
                        j["coordinates"] = std::move(rings);
                    }
                    return j;
                },
                geom);
        }

        boost::json::value featureToJson(Feature const &f) {
            boost::json::object j;
            j["type"] = "Feature";
            if (!f.id.empty())
                j["id"] = f.id;
            boost::json::object props;
            for (auto const &kv : f.properties)
                props[kv.first] = kv.second;
            j["properties"] = std::move(props);
            j["geometry"] = geometryToJson(f.geometry);
            return j;
        }

        boost::json::object collectionToJson(FeatureCollection const &fc) {
            boost::json::object j;
            j["type"] = "FeatureCollection";

            boost::json::object P;
            for (const auto &[key, value] : fc.global_properties)
                P[key] = value;
            if (!fc.kind.empty())
                P["kind"] = fc.kind;
            if (fc.year != 0)
                P["year"] = fc.year;
            j["properties"] = std::move(P);

            boost::json::array features;
            for (auto const &f : fc.features)
                features.push_back(featureToJson(f));
            j["features"] = std::move(features);
            return j;
        }

        boost::json::object toleranceToJson(Tolerance const &t) {
            boost::json::object j;
            j["distance"] = t.distance;
            j["lengthRatio"] = t.lengthRatio;
            j["angleDegrees"] = t.angleDegrees;
            return j;
        }

        void writeText(std::string const &text, std::filesystem::path const &outPath) {
            std::ofstream ofs(outPath);
            if (!ofs)
                throw std::runtime_error("Cannot open for write: " + outPath.string());
            ofs << text << "\n";
        }
    } // namespace

    std::string toJson(FeatureCollection const &fc) { return boost::json::serialize(collectionToJson(fc)); }

    std::string toJson(ComparisonResult const &result) {
        auto j = collectionToJson(result.features);
        auto &P = j["properties"].as_object();
        P["comparedFrom"] = result.beforeYear;
        P["comparedTo"] = result.afterYear;

        if (result.calibration) {
            auto const &c = *result.calibration;
            boost::json::object cal;
            cal["tolerance"] = toleranceToJson(c.tolerance);
            cal["yearsElapsed"] = c.yearsElapsed;
            cal["expectedRate"] = c.expectedRate;

            boost::json::object stats;
            stats["step"] = c.stats.step;
            stats["multiplier"] = c.stats.multiplier;
            stats["achievedRate"] = c.stats.achievedRate;
            stats["targetRate"] = c.stats.targetRate;
            stats["acceptableRate"] = c.stats.acceptableRate;
            stats["converged"] = c.stats.converged;
            stats["added"] = c.stats.added;
            stats["removed"] = c.stats.removed;
            stats["unchanged"] = c.stats.unchanged;
            boost::json::array rates;
            for (double r : c.stats.rates)
                rates.push_back(r);
            stats["rates"] = std::move(rates);
            cal["stats"] = std::move(stats);

            P["calibration"] = std::move(cal);
        }
        return boost::json::serialize(j);
    }

    std::string toJson(ValidationResult const &result) {
        auto j = collectionToJson(validationCollection(result));
        auto &P = j["properties"].as_object();
        P["truePositives"] = result.truePositives;
        P["falsePositives"] = result.falsePositives;
        P["falseNegatives"] = result.falseNegatives;
        P["precision"] = result.precision;
        P["recall"] = result.recall;
        P["f1Score"] = result.f1;
        P["totalDetected"] = result.totalDetected;
        P["totalReference"] = result.totalReference;
        return boost::json::serialize(j);
    }

    void WriteFeatureCollection(FeatureCollection const &fc, std::filesystem::path const &outPath) {
        writeText(toJson(fc), outPath);
    }

    void WriteComparison(ComparisonResult const &result, std::filesystem::path const &outPath) {
        writeText(toJson(result), outPath);
    }

    void WriteValidation(ValidationResult const &result, std::filesystem::path const &outPath) {
        writeText(toJson(result), outPath);
    }

} // namespace changekit
