#include "changekit/config.hpp"
#include "json_io.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>

namespace changekit {

    namespace {
        constexpr const char *kCaller = "changekit::LoadConfig()";

        using json = boost::json::value;

        const boost::json::object *section(const boost::json::object &root, const char *name) {
            if (!root.contains(name))
                return nullptr;
            if (!root.at(name).is_object())
                throw std::runtime_error(std::string(kCaller) + ": '" + name + "' must be an object");
            return &root.at(name).as_object();
        }

        void readNumber(const boost::json::object &obj, const char *key, double &out) {
            if (obj.contains(key))
                out = detail::toDouble(obj.at(key), kCaller, key);
        }

        std::string readString(const json &v, const char *key) {
            if (!v.is_string())
                throw std::runtime_error(std::string(kCaller) + ": '" + key + "' must be a string");
            return std::string(v.as_string());
        }

        void readTolerance(const boost::json::object *obj, Tolerance &t) {
            if (!obj)
                return;
            readNumber(*obj, "distance", t.distance);
            readNumber(*obj, "length_ratio", t.lengthRatio);
            readNumber(*obj, "angle", t.angleDegrees);
            validate(t);
        }

        void readCalibration(const boost::json::object *obj, CalibrationConfig &c) {
            if (!obj)
                return;
            readNumber(*obj, "expected_yearly_rate", c.expectedYearlyRate);
            readNumber(*obj, "acceptable_factor", c.acceptableFactor);
            readNumber(*obj, "max_acceptable_rate", c.maxAcceptableRate);
            readNumber(*obj, "length_ratio_cap", c.lengthRatioCap);
            readNumber(*obj, "angle_cap", c.angleCap);
            readNumber(*obj, "warning_multiplier", c.warningMultiplier);
            readNumber(*obj, "critical_multiplier", c.criticalMultiplier);
            if (obj->contains("multipliers")) {
                auto const &v = obj->at("multipliers");
                if (!v.is_array())
                    throw std::runtime_error(std::string(kCaller) + ": 'multipliers' must be an array");
                c.multipliers.clear();
                for (auto const &m : v.as_array())
                    c.multipliers.push_back(detail::toDouble(m, kCaller, "multiplier"));
            }
            if (obj->contains("order")) {
                auto order = readString(obj->at("order"), "order");
                if (order == "collection")
                    c.order = MatchOrder::Collection;
                else if (order == "id")
                    c.order = MatchOrder::ById;
                else
                    throw std::runtime_error(std::string(kCaller) + ": unknown match order '" + order + "'");
            }
            validate(c);
        }

        EngineConfig fromJson(const json &j) {
            if (!j.is_object())
                throw std::runtime_error(std::string(kCaller) + ": top-level value must be an object");
            auto const &root = j.as_object();

            EngineConfig cfg;
            if (root.contains("data_dir"))
                cfg.dataDir = readString(root.at("data_dir"), "data_dir");
            if (root.contains("log_level"))
                cfg.logLevel = readString(root.at("log_level"), "log_level");

            readTolerance(section(root, "tolerance"), cfg.tolerance);
            readTolerance(section(root, "validation_tolerance"), cfg.validationTolerance);
            readCalibration(section(root, "calibration"), cfg.calibration);

            if (auto *index = section(root, "index")) {
                readNumber(*index, "scale", cfg.indexScale);
                if (!std::isfinite(cfg.indexScale) || cfg.indexScale <= 0.0)
                    throw std::runtime_error(std::string(kCaller) + ": index scale must be positive");
            }
            return cfg;
        }
    } // namespace

    EngineConfig LoadConfig(const std::filesystem::path &file) {
        auto cfg = fromJson(detail::readJsonFile(file, kCaller));
        spdlog::info("[Config] loaded {}: data_dir={} distance={} lengthRatio={} angle={} schedule={} steps",
                     file.string(), cfg.dataDir.string(), cfg.tolerance.distance, cfg.tolerance.lengthRatio,
                     cfg.tolerance.angleDegrees, cfg.calibration.multipliers.size());
        return cfg;
    }

    EngineConfig ParseConfig(const std::string &text) { return fromJson(detail::parseJson(text, kCaller)); }

    void applyLogLevel(std::string const &level) {
        auto lvl = spdlog::level::from_str(level);
        if (lvl == spdlog::level::off && level != "off")
            throw std::invalid_argument("changekit::applyLogLevel(): unknown log level '" + level + "'");
        spdlog::set_level(lvl);
    }

} // namespace changekit
