#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <string>

namespace changekit {
    namespace detail {

        // Reads and parses a JSON document. `caller` prefixes error messages.
        boost::json::value readJsonFile(const std::filesystem::path &file, const char *caller);

        boost::json::value parseJson(const std::string &text, const char *caller);

        // String values as is, anything else serialized
        std::string toPropertyString(boost::json::value const &v);

        double toDouble(boost::json::value const &v, const char *caller, const char *what);

    } // namespace detail
} // namespace changekit
