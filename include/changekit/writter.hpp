#pragma once

#include "changekit/session.hpp"
#include "changekit/types.hpp"
#include "changekit/validator.hpp"

#include <filesystem>
#include <string>

namespace changekit {

    std::string toJson(FeatureCollection const &fc);

    // Tagged features plus calibration metadata in the top-level properties
    std::string toJson(ComparisonResult const &result);

    // Tagged features plus the confusion counts and metrics
    std::string toJson(ValidationResult const &result);

    void WriteFeatureCollection(FeatureCollection const &fc, const std::filesystem::path &outPath);

    void WriteComparison(ComparisonResult const &result, const std::filesystem::path &outPath);

    void WriteValidation(ValidationResult const &result, const std::filesystem::path &outPath);

} // namespace changekit
