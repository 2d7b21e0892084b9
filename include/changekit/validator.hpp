#pragma once

#include "changekit/data_source.hpp"
#include "changekit/matcher.hpp"
#include "changekit/spatial_index.hpp"
#include "changekit/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace changekit {

    struct ValidationResult {
        std::size_t truePositives = 0;
        std::size_t falsePositives = 0;
        std::size_t falseNegatives = 0;
        double precision = 0.0;
        double recall = 0.0;
        double f1 = 0.0;
        std::size_t totalDetected = 0;
        std::size_t totalReference = 0;
        std::vector<Feature> matchedDetected;    // true_positive
        std::vector<Feature> unmatchedDetected;  // false_positive
        std::vector<Feature> unmatchedReference; // false_negative
    };

    enum class MatchQuality { Good, Moderate, Poor };

    const char *toString(MatchQuality q);

    struct Pairing {
        int detected = 0;
        int reference = 0;
        int yearDiff = 0;
        MatchQuality matchQuality = MatchQuality::Good;
    };

    // Detected features play the "after" role against an index over the
    // reference. Fixed tolerance, no calibration.
    ValidationResult validate(FeatureCollection const &detected, FeatureCollection const &reference,
                              Tolerance const &tolerance = defaultValidationTolerance(),
                              double indexScale = SpatialIndex::kDefaultScale,
                              MatchOrder order = MatchOrder::Collection);

    // All three tagged lists in one collection, for rendering
    FeatureCollection validationCollection(ValidationResult const &result);

    // Latest reference year not after `detectedYear`, else the nearest one
    std::optional<int> findBestReferenceYear(int detectedYear, std::vector<int> const &referenceYears);

    MatchQuality pairingQuality(int yearDiff);

    std::vector<Pairing> suggestedPairings(std::vector<int> const &detectedYears,
                                           std::vector<int> const &referenceYears);

    class Validator {
      public:
        explicit Validator(DataLoader &loader, Tolerance tolerance = defaultValidationTolerance(),
                           double indexScale = SpatialIndex::kDefaultScale);

        // Detected side is the year's network collection. A missing side gives an all-zero result
        ValidationResult validateYears(int detectedYear, int referenceYear);

        Tolerance const &tolerance() const { return tolerance_; }

      private:
        DataLoader &loader_;
        Tolerance tolerance_;
        double indexScale_;
    };

} // namespace changekit
