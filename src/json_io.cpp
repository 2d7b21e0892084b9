#include "json_io.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace changekit {
    namespace detail {

        boost::json::value parseJson(const std::string &text, const char *caller) {
            boost::system::error_code ec;
            boost::json::value j = boost::json::parse(text, ec);
            if (ec)
                throw std::runtime_error(std::string(caller) + ": failed to parse JSON: " + ec.message());
            return j;
        }

        boost::json::value readJsonFile(const std::filesystem::path &file, const char *caller) {
            std::ifstream ifs(file);
            if (!ifs)
                throw std::runtime_error(std::string(caller) + ": cannot open \"" + file.string() + '\"');

            std::stringstream buffer;
            buffer << ifs.rdbuf();
            return parseJson(buffer.str(), caller);
        }

        std::string toPropertyString(boost::json::value const &v) {
            if (v.is_string())
                return std::string(v.as_string());
            return boost::json::serialize(v);
        }

        double toDouble(boost::json::value const &v, const char *caller, const char *what) {
            if (!v.is_number())
                throw std::runtime_error(std::string(caller) + ": " + what + " is not a number");
            return boost::json::value_to<double>(v);
        }

    } // namespace detail
} // namespace changekit
