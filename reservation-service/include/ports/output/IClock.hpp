#pragma once

#include "domain/Timestamp.hpp"

namespace reservation::ports::output {

/**
 * @brief Источник текущего времени
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual domain::Timestamp now() const = 0;
};

} // namespace reservation::ports::output
