#include "changekit/comparator.hpp"
#include "changekit/geometry.hpp"
#include "changekit/matcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <memory>

namespace changekit {

    namespace {
        std::shared_ptr<ComparisonResult> emptyResult(int beforeYear, int afterYear) {
            auto r = std::make_shared<ComparisonResult>();
            r->beforeYear = beforeYear;
            r->afterYear = afterYear;
            return r;
        }

        bool enabled(Feature const &f, std::set<Category> const &categories) {
            return categories.count(category(f)) > 0;
        }
    } // namespace

    const char *toString(ChangeQuality q) {
        switch (q) {
        case ChangeQuality::Good:
            return "good";
        case ChangeQuality::Warning:
            return "warning";
        case ChangeQuality::Critical:
            break;
        }
        return "critical";
    }

    std::optional<Status> statusOf(Feature const &f) {
        auto it = f.properties.find("status");
        if (it == f.properties.end())
            return std::nullopt;
        if (it->second == "added")
            return Status::Added;
        if (it->second == "removed")
            return Status::Removed;
        if (it->second == "unchanged")
            return Status::Unchanged;
        return std::nullopt;
    }

    Feature tagged(Feature const &f, Status status, int fromYear, int toYear) {
        Feature out = f;
        out.properties["status"] = toString(status);
        out.properties["comparedFrom"] = std::to_string(fromYear);
        out.properties["comparedTo"] = std::to_string(toYear);
        return out;
    }

    Summary summarize(FeatureCollection const &tagged) {
        Summary s;
        s.total = tagged.features.size();
        for (auto const &f : tagged.features) {
            if (auto st = statusOf(f)) {
                switch (*st) {
                case Status::Added:
                    ++s.added;
                    break;
                case Status::Removed:
                    ++s.removed;
                    break;
                case Status::Unchanged:
                    ++s.unchanged;
                    break;
                }
            }
            ++s.byType[typeLabel(f)];
            if (auto len = measuredLength(f))
                s.totalLength += *len;
        }
        const auto before = s.unchanged + s.removed;
        if (before > 0)
            s.continuity = static_cast<double>(s.unchanged) / static_cast<double>(before);
        return s;
    }

    Summary summarize(ComparisonResult const &result) { return summarize(result.features); }

    ChangeQuality assessQuality(double rate, int yearsElapsed, CalibrationConfig const &config) {
        const double target = targetRate(config, yearsElapsed);
        if (rate > target * config.criticalMultiplier)
            return ChangeQuality::Critical;
        if (rate > target * config.warningMultiplier)
            return ChangeQuality::Warning;
        return ChangeQuality::Good;
    }

    Comparator::Comparator(DataLoader &loader, CalibrationConfig config, double indexScale)
        : loader_(loader), config_(std::move(config)), indexScale_(indexScale) {
        validate(config_);
    }

    std::set<Category> Comparator::allCategories() {
        return {Category::Sidewalk, Category::Crosswalk, Category::Road, Category::Unknown};
    }

    ComparisonPtr Comparator::compareYears(Session &session, int beforeYear, int afterYear) {
        if (auto hit = session.cached(beforeYear, afterYear)) {
            spdlog::debug("[Comparator] cache hit {} -> {} (v{})", beforeYear, afterYear, session.toleranceVersion());
            return hit;
        }

        // I/O stage: both fetches in flight before either is joined
        auto pendingBefore = loader_.fetchYear(beforeYear);
        auto pendingAfter = loader_.fetchYear(afterYear);
        auto before = loader_.takeYear(beforeYear, pendingBefore);
        auto after = loader_.takeYear(afterYear, pendingAfter);

        ComparisonPtr result;
        if (!before || !after) {
            spdlog::warn("[Comparator] missing data for {} -> {}, returning empty comparison", beforeYear, afterYear);
            result = emptyResult(beforeYear, afterYear);
        } else {
            result = compute(session, beforeYear, afterYear, *before, *after);
        }

        session.store(beforeYear, afterYear, result);
        return result;
    }

    ComparisonPtr Comparator::compute(Session const &session, int beforeYear, int afterYear,
                                      FeatureCollection const &before, FeatureCollection const &after) const {
        const int yearsElapsed = std::abs(afterYear - beforeYear);

        auto beforeMetrics = measure(before);
        auto afterMetrics = measure(after);
        SpatialIndex index(beforeMetrics, indexScale_);

        auto cal = calibrate(beforeMetrics, afterMetrics, index, iterationOrder(after, config_.order), yearsElapsed,
                             session.getTolerance(), config_);

        auto r = emptyResult(beforeYear, afterYear);
        auto &out = r->features.features;
        out.reserve(before.features.size() + after.features.size() - cal.match.size());

        for (std::size_t i = 0; i < after.features.size(); ++i) {
            if (cal.match.isAfterClaimed(i))
                out.push_back(tagged(after.features[i], Status::Unchanged, beforeYear, afterYear));
        }
        for (std::size_t i = 0; i < after.features.size(); ++i) {
            if (!cal.match.isAfterClaimed(i))
                out.push_back(tagged(after.features[i], Status::Added, beforeYear, afterYear));
        }
        for (std::size_t i = 0; i < before.features.size(); ++i) {
            if (!cal.match.isBeforeClaimed(i))
                out.push_back(tagged(before.features[i], Status::Removed, beforeYear, afterYear));
        }

        r->features.kind = after.kind;
        r->features.year = afterYear;
        r->calibration = ComparisonCalibration{cal.tolerance, cal.stats, yearsElapsed, config_.expectedYearlyRate};

        spdlog::info("[Comparator] {} -> {}: unchanged={} added={} removed={} rate={:.4f} (x{}{})", beforeYear,
                     afterYear, cal.stats.unchanged, cal.stats.added, cal.stats.removed, cal.stats.achievedRate,
                     cal.stats.multiplier, cal.stats.converged ? "" : ", not converged");
        return r;
    }

    ComparisonPtr Comparator::getDataForYear(Session &session, int year, std::vector<int> const &availableYears) {
        const bool noYears = availableYears.empty();
        const int firstYear = noYears ? year : *std::min_element(availableYears.begin(), availableYears.end());

        if (noYears || year == firstYear) {
            auto data = loader_.loadYear(year);
            auto r = emptyResult(year, year);
            if (!data)
                return r;
            r->features.kind = data->kind;
            r->features.year = year;
            r->features.global_properties = data->global_properties;
            r->features.features.reserve(data->features.size());
            for (auto const &f : data->features) {
                Feature out = f;
                out.properties["status"] = toString(Status::Unchanged);
                r->features.features.push_back(std::move(out));
            }
            return r;
        }

        int previous = firstYear;
        bool found = false;
        for (int y : availableYears) {
            if (y < year && (!found || y > previous)) {
                previous = y;
                found = true;
            }
        }
        return compareYears(session, previous, year);
    }

    std::vector<YearMetrics> Comparator::generateMetrics(Session &session, std::vector<int> years,
                                                         std::set<Category> const &categories) {
        std::sort(years.begin(), years.end());
        years.erase(std::unique(years.begin(), years.end()), years.end());

        std::vector<YearMetrics> rows;
        rows.reserve(years.size());
        for (std::size_t i = 0; i < years.size(); ++i) {
            YearMetrics row;
            row.year = years[i];

            if (i == 0) {
                if (auto data = loader_.loadYear(years[i])) {
                    for (auto const &f : data->features) {
                        if (!enabled(f, categories))
                            continue;
                        ++row.unchanged;
                        row.totalLength += measuredLength(f).value_or(0.0);
                    }
                }
            } else {
                auto cmp = compareYears(session, years[i - 1], years[i]);
                for (auto const &f : cmp->features.features) {
                    if (!enabled(f, categories))
                        continue;
                    auto st = statusOf(f);
                    if (st == Status::Added)
                        ++row.added;
                    else if (st == Status::Removed)
                        ++row.removed;
                    else if (st == Status::Unchanged)
                        ++row.unchanged;
                    if (st != Status::Removed)
                        row.totalLength += measuredLength(f).value_or(0.0);
                }
            }

            row.segments = row.added + row.unchanged;
            row.net = static_cast<long long>(row.added) - static_cast<long long>(row.removed);
            rows.push_back(row);
        }
        return rows;
    }

} // namespace changekit
