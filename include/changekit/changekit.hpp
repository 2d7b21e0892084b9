#pragma once

#include "calibrator.hpp"
#include "comparator.hpp"
#include "config.hpp"
#include "data_source.hpp"
#include "geometry.hpp"
#include "matcher.hpp"
#include "parser.hpp"
#include "session.hpp"
#include "similarity.hpp"
#include "spatial_index.hpp"
#include "types.hpp"
#include "validator.hpp"
#include "writter.hpp"

namespace changekit {

    inline FeatureCollection read(const std::filesystem::path &file) { return ReadFeatureCollection(file); }

    inline void write(const FeatureCollection &fc, const std::filesystem::path &outPath) {
        WriteFeatureCollection(fc, outPath);
    }

} // namespace changekit

namespace ck = changekit;
