#pragma once

#include "changekit/calibrator.hpp"
#include "changekit/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <tuple>

namespace changekit {

    struct ComparisonCalibration {
        Tolerance tolerance;
        CalibrationStats stats;
        int yearsElapsed = 0;
        double expectedRate = 0.0;
    };

    struct ComparisonResult {
        FeatureCollection features;
        std::optional<ComparisonCalibration> calibration;
        int beforeYear = 0;
        int afterYear = 0;
    };

    using ComparisonPtr = std::shared_ptr<const ComparisonResult>;

    // Owns the active tolerance, its version counter and the comparison cache.
    // Changing the tolerance bumps the version; older cache entries become
    // unreachable and stay in memory until evictStale() or clearCache().
    class Session {
      public:
        Session();
        explicit Session(Tolerance const &tolerance);

        Tolerance const &getTolerance() const { return tolerance_; }

        // Validates, stores and returns the new version
        std::uint64_t setTolerance(Tolerance const &tolerance);

        std::uint64_t toleranceVersion() const { return version_; }

        ComparisonPtr cached(int beforeYear, int afterYear) const;
        void store(int beforeYear, int afterYear, ComparisonPtr result);

        std::size_t cacheSize() const { return cache_.size(); }
        std::size_t evictStale();
        void clearCache() { cache_.clear(); }

      private:
        using Key = std::tuple<int, int, std::uint64_t>;

        Tolerance tolerance_;
        std::uint64_t version_ = 0;
        std::map<Key, ComparisonPtr> cache_;
    };

} // namespace changekit
