#include "changekit/parser.hpp"
#include "json_io.hpp"

#include <boost/json.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

namespace changekit {

    namespace {
        constexpr const char *kCaller = "changekit::ReadFeatureCollection()";

        using json = boost::json::value;

        // Feature and bare geometry documents are wrapped into a FeatureCollection
        json normalize(json j) {
            if (!j.is_object() || !j.as_object().contains("type") || !j.as_object().at("type").is_string()) {
                throw std::runtime_error(std::string(kCaller) + ": top-level object has no string 'type' field");
            }

            auto type = std::string(j.as_object().at("type").as_string());
            if (type == "FeatureCollection") {
                return j;
            }
            if (type == "Feature") {
                boost::json::object fc;
                fc["type"] = "FeatureCollection";
                boost::json::array features;
                features.push_back(std::move(j));
                fc["features"] = std::move(features);
                return fc;
            }

            boost::json::object feat;
            feat["type"] = "Feature";
            feat["geometry"] = std::move(j);
            feat["properties"] = boost::json::object();
            boost::json::object fc;
            fc["type"] = "FeatureCollection";
            boost::json::array features;
            features.push_back(std::move(feat));
            fc["features"] = std::move(features);
            return fc;
        }

        const boost::json::array &asArray(const json &v, const char *what) {
            if (!v.is_array())
                throw std::runtime_error(std::string(kCaller) + ": " + what + " is not an array");
            return v.as_array();
        }

        Properties parseProperties(const json &props) {
            Properties m;
            if (!props.is_object())
                return m;
            auto const &obj = props.as_object();
            m.reserve(obj.size());
            for (auto const &item : obj)
                m[std::string(item.key())] = detail::toPropertyString(item.value());
            return m;
        }

        dp::Point parsePoint(const json &coords) {
            auto const &arr = asArray(coords, "position");
            if (arr.size() < 2)
                throw std::runtime_error(std::string(kCaller) + ": position has fewer than 2 coordinates");
            double x = detail::toDouble(arr.at(0), kCaller, "coordinate");
            double y = detail::toDouble(arr.at(1), kCaller, "coordinate");
            return dp::Point{x, y, 0.0};
        }

        Geometry parseLineString(const json &coords) {
            std::vector<dp::Point> pts;
            auto const &arr = asArray(coords, "LineString coordinates");
            pts.reserve(arr.size());
            for (auto const &c : arr)
                pts.push_back(parsePoint(c));
            if (pts.size() == 2)
                return dp::Segment{pts[0], pts[1]};
            else
                return pts;
        }

        dp::Polygon parsePolygon(const json &coords) {
            std::vector<dp::Point> pts;
            auto const &rings = asArray(coords, "Polygon coordinates");
            if (!rings.empty()) {
                // Outer ring only
                auto const &ring = asArray(rings.at(0), "Polygon ring");
                pts.reserve(ring.size());
                for (auto const &c : ring)
                    pts.push_back(parsePoint(c));
            }
            return dp::Polygon{dp::Vector<dp::Point>{pts.begin(), pts.end()}};
        }

        std::vector<Geometry> parseGeometry(const json &geom) {
            std::vector<Geometry> out;
            if (!geom.is_object())
                throw std::runtime_error(std::string(kCaller) + ": geometry is not an object");
            auto const &obj = geom.as_object();
            if (!obj.contains("type") || !obj.at("type").is_string())
                throw std::runtime_error(std::string(kCaller) + ": geometry has no string 'type' field");
            auto type = std::string(obj.at("type").as_string());

            auto coordinates = [&]() -> const json & {
                if (!obj.contains("coordinates"))
                    throw std::runtime_error(std::string(kCaller) + ": " + type + " has no 'coordinates'");
                return obj.at("coordinates");
            };

            if (type == "Point") {
                out.emplace_back(parsePoint(coordinates()));
            } else if (type == "LineString") {
                out.emplace_back(parseLineString(coordinates()));
            } else if (type == "Polygon") {
                out.emplace_back(parsePolygon(coordinates()));
            } else if (type == "MultiPoint") {
                for (auto const &c : asArray(coordinates(), "MultiPoint coordinates"))
                    out.emplace_back(parsePoint(c));
            } else if (type == "MultiLineString") {
                for (auto const &line : asArray(coordinates(), "MultiLineString coordinates"))
                    out.emplace_back(parseLineString(line));
            } else if (type == "MultiPolygon") {
                for (auto const &poly : asArray(coordinates(), "MultiPolygon coordinates"))
                    out.emplace_back(parsePolygon(poly));
            } else if (type == "GeometryCollection") {
                if (obj.contains("geometries")) {
                    for (auto const &sub : asArray(obj.at("geometries"), "geometries")) {
                        auto subs = parseGeometry(sub);
                        out.insert(out.end(), subs.begin(), subs.end());
                    }
                }
            } else {
                throw std::runtime_error(std::string(kCaller) + ": unknown geometry type '" + type + "'");
            }
            return out;
        }

        std::string featureId(const boost::json::object &feat, const Properties &props, std::size_t index) {
            if (feat.contains("id") && !feat.at("id").is_null())
                return detail::toPropertyString(feat.at("id"));
            auto it = props.find("id");
            if (it != props.end() && !it->second.empty())
                return it->second;
            return std::to_string(index);
        }

        FeatureCollection fromJson(json j) {
            auto fc_json = normalize(std::move(j));
            auto const &fc_obj = fc_json.as_object();

            FeatureCollection fc;

            if (fc_obj.contains("properties") && fc_obj.at("properties").is_object()) {
                for (const auto &[key, value] : fc_obj.at("properties").as_object())
                    fc.global_properties[std::string(key)] = detail::toPropertyString(value);
            }

            if (!fc_obj.contains("features"))
                return fc;
            auto const &features = asArray(fc_obj.at("features"), "features");
            fc.features.reserve(features.size());

            std::size_t index = 0;
            for (auto const &feat : features) {
                const std::size_t position = index++;
                if (!feat.is_object())
                    throw std::runtime_error(std::string(kCaller) + ": feature is not an object");
                auto const &feat_obj = feat.as_object();
                if (!feat_obj.contains("geometry") || feat_obj.at("geometry").is_null())
                    continue;

                auto geoms = parseGeometry(feat_obj.at("geometry"));
                Properties props_map;
                if (feat_obj.contains("properties"))
                    props_map = parseProperties(feat_obj.at("properties"));
                auto id = featureId(feat_obj, props_map, position);

                if (geoms.size() == 1) {
                    fc.features.emplace_back(Feature{std::move(id), std::move(geoms.front()), std::move(props_map)});
                    continue;
                }
                for (std::size_t k = 0; k < geoms.size(); ++k)
                    fc.features.emplace_back(Feature{id + ":" + std::to_string(k), std::move(geoms[k]), props_map});
            }

            return fc;
        }
    } // namespace

    FeatureCollection ReadFeatureCollection(const std::filesystem::path &file) {
        return fromJson(detail::readJsonFile(file, kCaller));
    }

    FeatureCollection ParseFeatureCollection(const std::string &text) {
        return fromJson(detail::parseJson(text, kCaller));
    }

    std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc) {
        os << "KIND: " << (fc.kind.empty() ? "-" : fc.kind) << "\n"
           << "YEAR: " << fc.year << "\n";
        os << "FEATURES: " << fc.features.size() << "\n";

        for (auto const &f : fc.features) {
            auto &v = f.geometry;
            if (std::get_if<dp::Polygon>(&v)) {
                os << "  POLYGON";
            } else if (std::get_if<dp::Segment>(&v)) {
                os << "  LINE";
            } else if (std::get_if<std::vector<dp::Point>>(&v)) {
                os << "  PATH";
            } else if (std::get_if<dp::Point>(&v)) {
                os << "  POINT";
            }
            os << " " << f.id << " " << toString(category(f)) << "\n";
            if (f.properties.size() > 0)
                os << "    PROPS:" << f.properties.size() << "\n";
        }

        return os;
    }

} // namespace changekit
