#include "changekit/session.hpp"

#include <spdlog/spdlog.h>

namespace changekit {

    Session::Session() : tolerance_(defaultTolerance()) {}

    Session::Session(Tolerance const &tolerance) : tolerance_(tolerance) { validate(tolerance_); }

    std::uint64_t Session::setTolerance(Tolerance const &tolerance) {
        validate(tolerance);
        tolerance_ = tolerance;
        ++version_;
        spdlog::info("[Session] tolerance v{}: distance={} lengthRatio={} angle={}", version_, tolerance_.distance,
                     tolerance_.lengthRatio, tolerance_.angleDegrees);
        return version_;
    }

    ComparisonPtr Session::cached(int beforeYear, int afterYear) const {
        auto it = cache_.find(Key{beforeYear, afterYear, version_});
        return it == cache_.end() ? nullptr : it->second;
    }

    void Session::store(int beforeYear, int afterYear, ComparisonPtr result) {
        cache_[Key{beforeYear, afterYear, version_}] = std::move(result);
    }

    std::size_t Session::evictStale() {
        std::size_t removed = 0;
        for (auto it = cache_.begin(); it != cache_.end();) {
            if (std::get<2>(it->first) != version_) {
                it = cache_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

} // namespace changekit
