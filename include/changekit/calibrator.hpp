#pragma once

#include "changekit/matcher.hpp"
#include "changekit/types.hpp"

#include <cstddef>
#include <vector>

namespace changekit {

    // Domain prior and relaxation schedule used by the calibrator
    struct CalibrationConfig {
        double expectedYearlyRate = 0.05;
        double acceptableFactor = 2.0;
        double maxAcceptableRate = 0.15;
        std::vector<double> multipliers{1.0, 1.5, 2.0, 3.0, 4.0, 6.0, 8.0, 10.0};
        double lengthRatioCap = 0.95;
        double angleCap = 80.0;
        // Only used by assessQuality()
        double warningMultiplier = 2.0;
        double criticalMultiplier = 4.0;
        MatchOrder order = MatchOrder::Collection;
    };

    // Throws std::invalid_argument on an empty or non-ascending schedule or out-of-range constants
    void validate(CalibrationConfig const &config);

    struct CalibrationStats {
        std::size_t step = 0;
        double multiplier = 1.0;
        double achievedRate = 0.0;
        double targetRate = 0.0;
        double acceptableRate = 0.0;
        bool converged = false;
        std::size_t added = 0;
        std::size_t removed = 0;
        std::size_t unchanged = 0;
        std::vector<double> rates; // one per evaluated step
    };

    struct Calibration {
        Tolerance tolerance;
        MatchResult match;
        CalibrationStats stats;
    };

    double targetRate(CalibrationConfig const &config, int yearsElapsed);

    double acceptableRate(CalibrationConfig const &config, int yearsElapsed);

    // base relaxed by one schedule multiplier: distance scales linearly,
    // lengthRatio and angle by sqrt(multiplier) up to their caps
    Tolerance relax(Tolerance const &base, double multiplier, CalibrationConfig const &config);

    // (added + removed) / max(1, |before|)
    double changeRate(MatchResult const &match);

    Calibration calibrate(std::vector<FeatureMetrics> const &before, std::vector<FeatureMetrics> const &after,
                          SpatialIndex const &beforeIndex, std::vector<std::size_t> const &afterOrder,
                          int yearsElapsed, Tolerance const &base, CalibrationConfig const &config);

    Calibration calibrate(FeatureCollection const &before, FeatureCollection const &after,
                          SpatialIndex const &beforeIndex, int yearsElapsed, Tolerance const &base,
                          CalibrationConfig const &config = {});

} // namespace changekit
