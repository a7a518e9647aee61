#include "RetentionPolicy.hpp"

#include <chrono>

namespace LogStream {

std::vector<size_t> selectExpired(const std::deque<ArchivedFile>& archived,
                                  const RetentionLimits& limits,
                                  TimePoint now) {
    std::vector<size_t> expired;
    const auto maxAge = std::chrono::hours(limits.maxAgeHours);

    for (size_t i = 0; i < archived.size(); ++i) {
        const bool beyondCount =
            limits.keepFiles > 0 && i >= limits.keepFiles;
        const bool tooOld =
            limits.maxAgeHours > 0 && now - archived[i].createdAt > maxAge;
        if (beyondCount || tooOld) {
            expired.push_back(i);
        }
    }
    return expired;
}

}  // namespace LogStream
