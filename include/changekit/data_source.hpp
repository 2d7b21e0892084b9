#pragma once

#include "changekit/types.hpp"

#include <array>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace changekit {

    struct Manifest {
        std::string name;
        std::vector<int> years;
        std::array<double, 2> center{0.0, 0.0}; // [lng, lat]
        double zoom = 0.0;
    };

    struct ReferenceManifest {
        std::string name;
        std::vector<int> availableYears;
    };

    // Retrieval boundary. Missing documents are std::nullopt, malformed ones throw.
    class DataSource {
      public:
        virtual ~DataSource() = default;

        virtual std::optional<Manifest> loadManifest() const = 0;
        virtual std::optional<FeatureCollection> loadFeatureCollection(std::string const &kind, int year) const = 0;
        virtual std::optional<FeatureCollection> loadReferenceCollection(int year) const = 0;
        virtual ReferenceManifest loadReferenceManifest() const = 0;
    };

    // Directory layout:
    //   manifest.json, polygons_<year>.geojson, network_<year>.geojson,
    //   reference/manifest.json, reference/planimetrics_<year>.geojson
    class FileDataSource : public DataSource {
      public:
        explicit FileDataSource(std::filesystem::path root);

        std::optional<Manifest> loadManifest() const override;
        std::optional<FeatureCollection> loadFeatureCollection(std::string const &kind, int year) const override;
        std::optional<FeatureCollection> loadReferenceCollection(int year) const override;
        ReferenceManifest loadReferenceManifest() const override;

        const std::filesystem::path &root() const { return root_; }

      private:
        std::filesystem::path root_;
    };

    using CollectionPtr = std::shared_ptr<const FeatureCollection>;

    // Memoizing front of a DataSource. fetch* run the retrieval on std::async
    // and return futures; the memo is only written on the calling thread when
    // a result is handed back through take*().
    class DataLoader {
      public:
        explicit DataLoader(const DataSource &source);

        // Preferred kind "polygons", falling back to "network"
        std::future<CollectionPtr> fetchYear(int year) const;
        // "network" only, the line data compared against reference planimetrics
        std::future<CollectionPtr> fetchNetwork(int year) const;
        std::future<CollectionPtr> fetchReference(int year) const;

        // Blocking helpers: join a fetch and memoize its result
        CollectionPtr loadYear(int year);
        CollectionPtr loadNetwork(int year);
        CollectionPtr loadReference(int year);

        std::optional<Manifest> loadManifest() const { return source_.loadManifest(); }
        ReferenceManifest loadReferenceManifest() const { return source_.loadReferenceManifest(); }

        // Join a pending fetch on the calling thread and memoize a found collection
        CollectionPtr takeYear(int year, std::future<CollectionPtr> &pending);
        CollectionPtr takeNetwork(int year, std::future<CollectionPtr> &pending);
        CollectionPtr takeReference(int year, std::future<CollectionPtr> &pending);

        void clear() { memo_.clear(); }
        std::size_t memoSize() const { return memo_.size(); }

      private:
        CollectionPtr memoized(std::string const &kind, int year) const;
        CollectionPtr take(std::string const &kind, int year, std::future<CollectionPtr> &pending);

        const DataSource &source_;
        std::map<std::pair<std::string, int>, CollectionPtr> memo_;
    };

    // Sorted copy of `all` without the years in `disabled`
    std::vector<int> enabledYears(std::vector<int> const &all, std::vector<int> const &disabled);

} // namespace changekit
