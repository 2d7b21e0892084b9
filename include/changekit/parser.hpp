#pragma once

#include "changekit/types.hpp"
#include <filesystem>
#include <iosfwd>
#include <string>

namespace changekit {

    // Accepts a FeatureCollection, a single Feature or a bare geometry.
    // Multi* geometries and GeometryCollections become one feature per part.
    // Throws std::runtime_error on unreadable or malformed input.
    FeatureCollection ReadFeatureCollection(const std::filesystem::path &file);

    FeatureCollection ParseFeatureCollection(const std::string &text);

    std::ostream &operator<<(std::ostream &os, FeatureCollection const &fc);

} // namespace changekit
