#pragma once

#include "changekit/calibrator.hpp"
#include "changekit/data_source.hpp"
#include "changekit/session.hpp"
#include "changekit/spatial_index.hpp"
#include "changekit/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace changekit {

    struct Summary {
        std::size_t total = 0;
        std::size_t added = 0;
        std::size_t removed = 0;
        std::size_t unchanged = 0;
        std::map<std::string, std::size_t> byType;
        double totalLength = 0.0;
        // unchanged / (unchanged + removed), unset without any "before" features
        std::optional<double> continuity;
    };

    struct YearMetrics {
        int year = 0;
        std::size_t segments = 0;
        std::size_t added = 0;
        std::size_t removed = 0;
        std::size_t unchanged = 0;
        long long net = 0;
        double totalLength = 0.0;
    };

    enum class ChangeQuality { Good, Warning, Critical };

    const char *toString(ChangeQuality q);

    // Status of a tagged feature, nullopt when untagged
    std::optional<Status> statusOf(Feature const &f);

    Summary summarize(ComparisonResult const &result);

    Summary summarize(FeatureCollection const &tagged);

    // Compares a change rate against the domain prior for the elapsed span
    ChangeQuality assessQuality(double rate, int yearsElapsed, CalibrationConfig const &config);

    // Change classification between yearly snapshots. Collections come from the
    // loader (I/O stage); matching and calibration run synchronously afterwards.
    class Comparator {
      public:
        explicit Comparator(DataLoader &loader, CalibrationConfig config = {},
                            double indexScale = SpatialIndex::kDefaultScale);

        // Cached per (beforeYear, afterYear, tolerance version). A missing year
        // gives an empty result without calibration.
        ComparisonPtr compareYears(Session &session, int beforeYear, int afterYear);

        // Earliest available year is the baseline (everything unchanged); later
        // years are compared against the nearest earlier available year.
        ComparisonPtr getDataForYear(Session &session, int year, std::vector<int> const &availableYears);

        // One row per year in ascending order, counting only `categories`
        std::vector<YearMetrics> generateMetrics(Session &session, std::vector<int> years,
                                                 std::set<Category> const &categories = allCategories());

        CalibrationConfig const &calibrationConfig() const { return config_; }

        static std::set<Category> allCategories();

      private:
        ComparisonPtr compute(Session const &session, int beforeYear, int afterYear, FeatureCollection const &before,
                              FeatureCollection const &after) const;

        DataLoader &loader_;
        CalibrationConfig config_;
        double indexScale_;
    };

    // Copy of `f` with status tag and compared years
    Feature tagged(Feature const &f, Status status, int fromYear, int toYear);

} // namespace changekit
