#include "changekit/validator.hpp"
#include "changekit/geometry.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace changekit {

    namespace {
        double ratio(std::size_t num, std::size_t den) {
            return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
        }

        Feature withStatus(Feature const &f, ValidationStatus status) {
            Feature out = f;
            out.properties["validation_status"] = toString(status);
            return out;
        }
    } // namespace

    const char *toString(MatchQuality q) {
        switch (q) {
        case MatchQuality::Good:
            return "good";
        case MatchQuality::Moderate:
            return "moderate";
        case MatchQuality::Poor:
            break;
        }
        return "poor";
    }

    ValidationResult validate(FeatureCollection const &detected, FeatureCollection const &reference,
                              Tolerance const &tolerance, double indexScale, MatchOrder order) {
        changekit::validate(tolerance);

        SpatialIndex index(reference, indexScale);
        auto match = greedyMatch(reference, detected, index, tolerance, order);

        ValidationResult r;
        r.totalDetected = detected.features.size();
        r.totalReference = reference.features.size();
        r.truePositives = match.size();
        r.falsePositives = r.totalDetected - r.truePositives;
        r.falseNegatives = r.totalReference - match.size();

        r.precision = ratio(r.truePositives, r.truePositives + r.falsePositives);
        r.recall = ratio(r.truePositives, r.truePositives + r.falseNegatives);
        r.f1 = (r.precision + r.recall) > 0.0 ? 2.0 * r.precision * r.recall / (r.precision + r.recall) : 0.0;

        for (std::size_t i = 0; i < detected.features.size(); ++i) {
            if (match.isAfterClaimed(i))
                r.matchedDetected.push_back(withStatus(detected.features[i], ValidationStatus::TruePositive));
            else
                r.unmatchedDetected.push_back(withStatus(detected.features[i], ValidationStatus::FalsePositive));
        }
        for (std::size_t i = 0; i < reference.features.size(); ++i) {
            if (!match.isBeforeClaimed(i))
                r.unmatchedReference.push_back(withStatus(reference.features[i], ValidationStatus::FalseNegative));
        }

        spdlog::info("[Validator] tp={} fp={} fn={} precision={:.3f} recall={:.3f} f1={:.3f}", r.truePositives,
                     r.falsePositives, r.falseNegatives, r.precision, r.recall, r.f1);
        return r;
    }

    FeatureCollection validationCollection(ValidationResult const &result) {
        FeatureCollection fc;
        fc.kind = "validation";
        fc.features.reserve(result.matchedDetected.size() + result.unmatchedDetected.size() +
                            result.unmatchedReference.size());
        fc.features.insert(fc.features.end(), result.matchedDetected.begin(), result.matchedDetected.end());
        fc.features.insert(fc.features.end(), result.unmatchedDetected.begin(), result.unmatchedDetected.end());
        fc.features.insert(fc.features.end(), result.unmatchedReference.begin(), result.unmatchedReference.end());
        return fc;
    }

    std::optional<int> findBestReferenceYear(int detectedYear, std::vector<int> const &referenceYears) {
        if (referenceYears.empty())
            return std::nullopt;

        std::optional<int> best;
        for (int y : referenceYears) {
            if (y <= detectedYear && (!best || y > *best))
                best = y;
        }
        if (best)
            return best;

        int nearest = referenceYears.front();
        for (int y : referenceYears) {
            if (std::abs(y - detectedYear) < std::abs(nearest - detectedYear))
                nearest = y;
        }
        return nearest;
    }

    MatchQuality pairingQuality(int yearDiff) {
        if (yearDiff <= 2)
            return MatchQuality::Good;
        if (yearDiff <= 5)
            return MatchQuality::Moderate;
        return MatchQuality::Poor;
    }

    std::vector<Pairing> suggestedPairings(std::vector<int> const &detectedYears,
                                           std::vector<int> const &referenceYears) {
        std::vector<Pairing> out;
        for (int detected : detectedYears) {
            auto reference = findBestReferenceYear(detected, referenceYears);
            if (!reference)
                continue;
            Pairing p;
            p.detected = detected;
            p.reference = *reference;
            p.yearDiff = std::abs(detected - *reference);
            p.matchQuality = pairingQuality(p.yearDiff);
            out.push_back(p);
        }
        return out;
    }

    Validator::Validator(DataLoader &loader, Tolerance tolerance, double indexScale)
        : loader_(loader), tolerance_(tolerance), indexScale_(indexScale) {
        changekit::validate(tolerance_);
    }

    ValidationResult Validator::validateYears(int detectedYear, int referenceYear) {
        auto pendingDetected = loader_.fetchNetwork(detectedYear);
        auto pendingReference = loader_.fetchReference(referenceYear);
        auto detected = loader_.takeNetwork(detectedYear, pendingDetected);
        auto reference = loader_.takeReference(referenceYear, pendingReference);

        if (!detected || !reference) {
            spdlog::warn("[Validator] missing data for detected {} / reference {}", detectedYear, referenceYear);
            return ValidationResult{};
        }
        return validate(*detected, *reference, tolerance_, indexScale_);
    }

} // namespace changekit
