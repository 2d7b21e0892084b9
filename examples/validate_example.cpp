#include "changekit/changekit.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>

int main(int argc, char **argv) {
    try {
        ck::EngineConfig cfg;
        if (argc > 2)
            cfg = ck::LoadConfig(argv[2]);
        if (argc > 1)
            cfg.dataDir = argv[1];
        ck::applyLogLevel(cfg.logLevel);

        ck::FileDataSource source(cfg.dataDir);
        ck::DataLoader loader(source);

        auto manifest = loader.loadManifest();
        auto reference = loader.loadReferenceManifest();
        if (!manifest || reference.availableYears.empty()) {
            std::cerr << "Need both a manifest and reference years in " << cfg.dataDir << "\n";
            return 1;
        }

        ck::Validator validator(loader, cfg.validationTolerance, cfg.indexScale);

        std::cout << std::fixed << std::setprecision(3);
        for (auto const &p : ck::suggestedPairings(manifest->years, reference.availableYears)) {
            auto r = validator.validateYears(p.detected, p.reference);
            std::cout << p.detected << " vs " << p.reference << " (" << ck::toString(p.matchQuality) << ", "
                      << p.yearDiff << "y): tp=" << r.truePositives << " fp=" << r.falsePositives
                      << " fn=" << r.falseNegatives << " precision=" << r.precision << " recall=" << r.recall
                      << " f1=" << r.f1 << "\n";

            auto out = cfg.dataDir / ("validation_" + std::to_string(p.detected) + ".geojson");
            ck::WriteValidation(r, out);
        }
    } catch (std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
