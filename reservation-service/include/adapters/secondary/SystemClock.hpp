#pragma once

#include "ports/output/IClock.hpp"

namespace reservation::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp::now();
    }
};

} // namespace reservation::adapters::secondary
