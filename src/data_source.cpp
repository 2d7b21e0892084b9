#include "changekit/data_source.hpp"
#include "changekit/parser.hpp"
#include "json_io.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace changekit {

    namespace {
        constexpr const char *kYearKind = "year";
        constexpr const char *kNetworkKind = "network";
        constexpr const char *kReferenceKind = "reference";

        std::vector<int> parseYears(boost::json::value const &v, const char *caller) {
            std::vector<int> years;
            if (!v.is_array())
                throw std::runtime_error(std::string(caller) + ": years is not an array");
            for (auto const &y : v.as_array()) {
                const double d = detail::toDouble(y, caller, "year");
                if (!(d >= std::numeric_limits<int>::min() && d <= std::numeric_limits<int>::max()))
                    throw std::runtime_error(std::string(caller) + ": year out of range");
                years.push_back(static_cast<int>(d));
            }
            std::sort(years.begin(), years.end());
            years.erase(std::unique(years.begin(), years.end()), years.end());
            return years;
        }

        std::future<CollectionPtr> ready(CollectionPtr value) {
            std::promise<CollectionPtr> p;
            p.set_value(std::move(value));
            return p.get_future();
        }

        CollectionPtr share(std::optional<FeatureCollection> fc) {
            if (!fc)
                return nullptr;
            return std::make_shared<const FeatureCollection>(std::move(*fc));
        }
    } // namespace

    FileDataSource::FileDataSource(std::filesystem::path root) : root_(std::move(root)) {}

    std::optional<Manifest> FileDataSource::loadManifest() const {
        constexpr const char *caller = "changekit::FileDataSource::loadManifest()";
        auto path = root_ / "manifest.json";
        if (!std::filesystem::exists(path)) {
            spdlog::warn("[DataSource] manifest not found: {}", path.string());
            return std::nullopt;
        }

        auto j = detail::readJsonFile(path, caller);
        if (!j.is_object())
            throw std::runtime_error(std::string(caller) + ": manifest is not an object");
        auto const &obj = j.as_object();

        Manifest m;
        if (obj.contains("name") && obj.at("name").is_string())
            m.name = std::string(obj.at("name").as_string());
        if (obj.contains("years"))
            m.years = parseYears(obj.at("years"), caller);
        if (obj.contains("location") && obj.at("location").is_object()) {
            auto const &loc = obj.at("location").as_object();
            if (loc.contains("center")) {
                auto const &c = loc.at("center");
                if (!c.is_array() || c.as_array().size() < 2)
                    throw std::runtime_error(std::string(caller) + ": location.center must be [lng, lat]");
                m.center = {detail::toDouble(c.as_array().at(0), caller, "center"),
                            detail::toDouble(c.as_array().at(1), caller, "center")};
            }
            if (loc.contains("zoom"))
                m.zoom = detail::toDouble(loc.at("zoom"), caller, "zoom");
        }
        return m;
    }

    std::optional<FeatureCollection> FileDataSource::loadFeatureCollection(std::string const &kind, int year) const {
        if (kind != "polygons" && kind != "network")
            throw std::invalid_argument("changekit::FileDataSource::loadFeatureCollection(): unknown kind '" + kind +
                                        "'");
        auto path = root_ / (kind + "_" + std::to_string(year) + ".geojson");
        if (!std::filesystem::exists(path)) {
            spdlog::debug("[DataSource] no {} data for {}: {}", kind, year, path.string());
            return std::nullopt;
        }
        auto fc = ReadFeatureCollection(path);
        fc.kind = kind;
        fc.year = year;
        return fc;
    }

    std::optional<FeatureCollection> FileDataSource::loadReferenceCollection(int year) const {
        auto path = root_ / "reference" / ("planimetrics_" + std::to_string(year) + ".geojson");
        if (!std::filesystem::exists(path)) {
            spdlog::warn("[DataSource] reference data for {} not found: {}", year, path.string());
            return std::nullopt;
        }
        auto fc = ReadFeatureCollection(path);
        fc.kind = kReferenceKind;
        fc.year = year;
        return fc;
    }

    ReferenceManifest FileDataSource::loadReferenceManifest() const {
        constexpr const char *caller = "changekit::FileDataSource::loadReferenceManifest()";
        ReferenceManifest m;
        auto path = root_ / "reference" / "manifest.json";
        if (!std::filesystem::exists(path)) {
            spdlog::warn("[DataSource] reference manifest not available: {}", path.string());
            return m;
        }

        auto j = detail::readJsonFile(path, caller);
        if (!j.is_object())
            throw std::runtime_error(std::string(caller) + ": manifest is not an object");
        auto const &obj = j.as_object();
        if (obj.contains("name") && obj.at("name").is_string())
            m.name = std::string(obj.at("name").as_string());
        if (obj.contains("available_years"))
            m.availableYears = parseYears(obj.at("available_years"), caller);
        else if (obj.contains("availableYears"))
            m.availableYears = parseYears(obj.at("availableYears"), caller);
        return m;
    }

    DataLoader::DataLoader(const DataSource &source) : source_(source) {}

    CollectionPtr DataLoader::memoized(std::string const &kind, int year) const {
        auto it = memo_.find({kind, year});
        return it == memo_.end() ? nullptr : it->second;
    }

    std::future<CollectionPtr> DataLoader::fetchYear(int year) const {
        if (auto hit = memoized(kYearKind, year))
            return ready(std::move(hit));

        const DataSource *source = &source_;
        return std::async(std::launch::async, [source, year]() -> CollectionPtr {
            // Polygons are more consistent across years than the derived network
            if (auto fc = source->loadFeatureCollection("polygons", year))
                return share(std::move(fc));
            if (auto fc = source->loadFeatureCollection("network", year))
                return share(std::move(fc));
            spdlog::warn("[DataLoader] no polygon or network data for {}", year);
            return nullptr;
        });
    }

    std::future<CollectionPtr> DataLoader::fetchNetwork(int year) const {
        if (auto hit = memoized(kNetworkKind, year))
            return ready(std::move(hit));

        const DataSource *source = &source_;
        return std::async(std::launch::async, [source, year]() -> CollectionPtr {
            return share(source->loadFeatureCollection(kNetworkKind, year));
        });
    }

    std::future<CollectionPtr> DataLoader::fetchReference(int year) const {
        if (auto hit = memoized(kReferenceKind, year))
            return ready(std::move(hit));

        const DataSource *source = &source_;
        return std::async(std::launch::async,
                          [source, year]() -> CollectionPtr { return share(source->loadReferenceCollection(year)); });
    }

    CollectionPtr DataLoader::take(std::string const &kind, int year, std::future<CollectionPtr> &pending) {
        auto result = pending.get();
        if (result)
            memo_[{kind, year}] = result;
        return result;
    }

    CollectionPtr DataLoader::takeYear(int year, std::future<CollectionPtr> &pending) {
        return take(kYearKind, year, pending);
    }

    CollectionPtr DataLoader::takeNetwork(int year, std::future<CollectionPtr> &pending) {
        return take(kNetworkKind, year, pending);
    }

    CollectionPtr DataLoader::takeReference(int year, std::future<CollectionPtr> &pending) {
        return take(kReferenceKind, year, pending);
    }

    CollectionPtr DataLoader::loadYear(int year) {
        auto pending = fetchYear(year);
        return takeYear(year, pending);
    }

    CollectionPtr DataLoader::loadNetwork(int year) {
        auto pending = fetchNetwork(year);
        return takeNetwork(year, pending);
    }

    CollectionPtr DataLoader::loadReference(int year) {
        auto pending = fetchReference(year);
        return takeReference(year, pending);
    }

    std::vector<int> enabledYears(std::vector<int> const &all, std::vector<int> const &disabled) {
        std::vector<int> out;
        for (int y : all) {
            if (std::find(disabled.begin(), disabled.end(), y) == disabled.end())
                out.push_back(y);
        }
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }

} // namespace changekit
