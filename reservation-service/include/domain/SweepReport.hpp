#pragma once

#include "Timestamp.hpp"
#include <string>
#include <vector>

namespace reservation::domain {

/**
 * @brief Итог одного прохода очистки просроченных резерваций
 */
struct SweepReport {
    Timestamp startedAt;
    std::vector<std::string> expiredIds;
    int64_t releasedCapacity = 0;
    bool failed = false;
    std::string errorMessage;

    size_t expiredCount() const { return expiredIds.size(); }
};

} // namespace reservation::domain
