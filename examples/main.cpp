#include "changekit/changekit.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>

int main(int argc, char **argv) {
    try {
        // 1) Config: optional path to a JSON config, data dir from it or argv
        ck::EngineConfig cfg;
        if (argc > 2)
            cfg = ck::LoadConfig(argv[2]);
        if (argc > 1)
            cfg.dataDir = argv[1];
        ck::applyLogLevel(cfg.logLevel);

        ck::FileDataSource source(cfg.dataDir);
        ck::DataLoader loader(source);

        auto manifest = loader.loadManifest();
        if (!manifest || manifest->years.empty()) {
            std::cerr << "No manifest with years in " << cfg.dataDir << "\n";
            return 1;
        }
        std::cout << manifest->name << " (" << manifest->years.size() << " years)\n";

        // 2) Walk the timeline, each year against the previous one
        ck::Session session(cfg.tolerance);
        ck::Comparator comparator(loader, cfg.calibration, cfg.indexScale);

        for (int year : manifest->years) {
            auto data = comparator.getDataForYear(session, year, manifest->years);
            auto s = ck::summarize(*data);

            std::cout << year << ": total=" << s.total << " added=" << s.added << " removed=" << s.removed
                      << " unchanged=" << s.unchanged;
            if (s.continuity)
                std::cout << " continuity=" << std::fixed << std::setprecision(1) << *s.continuity * 100.0 << "%";
            if (data->calibration) {
                auto const &c = *data->calibration;
                auto quality = ck::assessQuality(c.stats.achievedRate, c.yearsElapsed, cfg.calibration);
                std::cout << " rate=" << std::setprecision(3) << c.stats.achievedRate << " x" << c.stats.multiplier
                          << " [" << ck::toString(quality) << "]";
            }
            std::cout << "\n";
            std::cout.unsetf(std::ios::fixed);
        }

        // 3) Save the latest comparison
        if (manifest->years.size() > 1) {
            auto last = comparator.getDataForYear(session, manifest->years.back(), manifest->years);
            auto out = cfg.dataDir / ("changes_" + std::to_string(manifest->years.back()) + ".geojson");
            ck::WriteComparison(*last, out);
            std::cout << "Saved " << out.string() << "\n";
        }
    } catch (std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
