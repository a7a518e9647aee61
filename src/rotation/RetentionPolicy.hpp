#pragma once

#include <cstdint>
#include <deque>
#include <filesystem>
#include <vector>

#include "entry/Timestamp.hpp"

namespace LogStream {

struct ArchivedFile {
    std::filesystem::path path;
    TimePoint createdAt;
    bool compressing = false;
};

struct RetentionLimits {
    // 0 disables the rule.
    uint32_t keepFiles = 7;
    uint32_t maxAgeHours = 24;
};

/**
 * Selects archived files that must be removed.
 *
 * A file expires when it ranks beyond the |keepFiles| most recent archives
 * or is older than |maxAgeHours| at |now|. |archived| must be ordered
 * newest first.
 *
 * @return indices into |archived|, ascending.
 */
std::vector<size_t> selectExpired(const std::deque<ArchivedFile>& archived,
                                  const RetentionLimits& limits, TimePoint now);

}  // namespace LogStream
