#include "changekit/calibrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace changekit {

    namespace {
        std::size_t addedCount(MatchResult const &m) { return m.claimedAfter.size() - m.size(); }
        std::size_t removedCount(MatchResult const &m) { return m.claimedBefore.size() - m.size(); }
    } // namespace

    void validate(CalibrationConfig const &config) {
        if (config.multipliers.empty())
            throw std::invalid_argument("changekit::validate(): calibration schedule is empty");
        for (std::size_t i = 0; i < config.multipliers.size(); ++i) {
            double m = config.multipliers[i];
            if (!std::isfinite(m) || m <= 0.0)
                throw std::invalid_argument("changekit::validate(): calibration multipliers must be positive");
            if (i > 0 && m < config.multipliers[i - 1])
                throw std::invalid_argument("changekit::validate(): calibration multipliers must be ascending");
        }
        if (!std::isfinite(config.expectedYearlyRate) || config.expectedYearlyRate < 0.0)
            throw std::invalid_argument("changekit::validate(): expected yearly rate must be >= 0");
        if (!std::isfinite(config.acceptableFactor) || config.acceptableFactor < 0.0)
            throw std::invalid_argument("changekit::validate(): acceptable factor must be >= 0");
        if (!std::isfinite(config.maxAcceptableRate) || config.maxAcceptableRate < 0.0)
            throw std::invalid_argument("changekit::validate(): max acceptable rate must be >= 0");
        if (!(config.lengthRatioCap >= 0.0 && config.lengthRatioCap <= 1.0))
            throw std::invalid_argument("changekit::validate(): length ratio cap must be in [0, 1]");
        if (!(config.angleCap >= 0.0 && config.angleCap <= 180.0))
            throw std::invalid_argument("changekit::validate(): angle cap must be in [0, 180]");
        if (!(config.warningMultiplier >= 0.0) || !(config.criticalMultiplier >= config.warningMultiplier))
            throw std::invalid_argument("changekit::validate(): quality multipliers must satisfy 0 <= warning <= critical");
    }

    double targetRate(CalibrationConfig const &config, int yearsElapsed) {
        return config.expectedYearlyRate * std::abs(yearsElapsed);
    }

    double acceptableRate(CalibrationConfig const &config, int yearsElapsed) {
        return std::min(targetRate(config, yearsElapsed) * config.acceptableFactor, config.maxAcceptableRate);
    }

    Tolerance relax(Tolerance const &base, double multiplier, CalibrationConfig const &config) {
        const double soft = std::sqrt(std::max(1.0, multiplier));
        Tolerance t;
        t.distance = base.distance * multiplier;
        t.lengthRatio = std::max(base.lengthRatio, std::min(config.lengthRatioCap, base.lengthRatio * soft));
        t.angleDegrees = std::max(base.angleDegrees, std::min(config.angleCap, base.angleDegrees * soft));
        return t;
    }

    double changeRate(MatchResult const &match) {
        const auto changed = static_cast<double>(addedCount(match) + removedCount(match));
        return changed / static_cast<double>(std::max<std::size_t>(1, match.claimedBefore.size()));
    }

    Calibration calibrate(std::vector<FeatureMetrics> const &before, std::vector<FeatureMetrics> const &after,
                          SpatialIndex const &beforeIndex, std::vector<std::size_t> const &afterOrder,
                          int yearsElapsed, Tolerance const &base, CalibrationConfig const &config) {
        validate(base);
        validate(config);

        const double target = targetRate(config, yearsElapsed);
        const double acceptable = acceptableRate(config, yearsElapsed);

        std::vector<double> rates;
        rates.reserve(config.multipliers.size());

        Calibration best;
        bool haveBest = false;
        double bestGap = 0.0;

        for (std::size_t step = 0; step < config.multipliers.size(); ++step) {
            const double m = config.multipliers[step];
            Tolerance t = relax(base, m, config);
            MatchResult match = greedyMatch(before, after, beforeIndex, t, afterOrder);
            const double rate = changeRate(match);
            rates.push_back(rate);

            spdlog::debug("[Calibrator] step {} x{} distance={:.6f} lengthRatio={:.3f} angle={:.1f} rate={:.4f}", step,
                          m, t.distance, t.lengthRatio, t.angleDegrees, rate);

            const double gap = std::fabs(rate - target);
            const bool accepted = rate <= acceptable;
            if (accepted || !haveBest || gap < bestGap) {
                best.tolerance = t;
                best.match = std::move(match);
                best.stats.step = step;
                best.stats.multiplier = m;
                best.stats.achievedRate = rate;
                haveBest = true;
                bestGap = gap;
            }
            if (accepted) {
                best.stats.converged = true;
                break;
            }
        }

        best.stats.targetRate = target;
        best.stats.acceptableRate = acceptable;
        best.stats.added = addedCount(best.match);
        best.stats.removed = removedCount(best.match);
        best.stats.unchanged = best.match.size();
        best.stats.rates = std::move(rates);

        if (best.stats.converged) {
            spdlog::debug("[Calibrator] accepted step {} (x{}) rate={:.4f} <= {:.4f}", best.stats.step,
                          best.stats.multiplier, best.stats.achievedRate, acceptable);
        } else {
            spdlog::info("[Calibrator] no step reached rate <= {:.4f}; using x{} with rate={:.4f} (target {:.4f})",
                         acceptable, best.stats.multiplier, best.stats.achievedRate, target);
        }
        return best;
    }

    Calibration calibrate(FeatureCollection const &before, FeatureCollection const &after,
                          SpatialIndex const &beforeIndex, int yearsElapsed, Tolerance const &base,
                          CalibrationConfig const &config) {
        return calibrate(measure(before), measure(after), beforeIndex, iterationOrder(after, config.order),
                         yearsElapsed, base, config);
    }

} // namespace changekit
