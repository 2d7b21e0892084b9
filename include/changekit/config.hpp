#pragma once

#include "changekit/calibrator.hpp"
#include "changekit/spatial_index.hpp"
#include "changekit/types.hpp"

#include <filesystem>
#include <string>

namespace changekit {

    struct EngineConfig {
        std::filesystem::path dataDir = "data";
        Tolerance tolerance = defaultTolerance();
        Tolerance validationTolerance = defaultValidationTolerance();
        CalibrationConfig calibration;
        double indexScale = SpatialIndex::kDefaultScale;
        std::string logLevel = "info";
    };

    // Sections missing from the file keep their defaults. Wrong types, invalid
    // tolerances or an invalid calibration schedule throw.
    //
    // {
    //   "data_dir": "data",
    //   "log_level": "info",
    //   "tolerance": {"distance": 0.0025, "length_ratio": 0.3, "angle": 15},
    //   "validation_tolerance": {"distance": 0.0001, "length_ratio": 0.4, "angle": 20},
    //   "calibration": {"expected_yearly_rate": 0.05, "acceptable_factor": 2, "max_acceptable_rate": 0.15,
    //                   "multipliers": [1, 1.5, 2, 3, 4, 6, 8, 10], "length_ratio_cap": 0.95, "angle_cap": 80,
    //                   "warning_multiplier": 2, "critical_multiplier": 4, "order": "collection"},
    //   "index": {"scale": 200}
    // }
    EngineConfig LoadConfig(const std::filesystem::path &file);

    EngineConfig ParseConfig(const std::string &text);

    // Sets the spdlog level from a name ("trace" .. "off")
    void applyLogLevel(std::string const &level);

} // namespace changekit
