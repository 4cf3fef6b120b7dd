#pragma once

#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace reservation::domain {

/**
 * @brief Бронируемая единица инвентаря (рейс, тип номера, класс авто)
 *
 * availableCapacity никогда не бывает отрицательным. Меняется только
 * движком резерваций под блокировкой строки.
 */
struct InventoryUnit {
    std::string id;
    int64_t availableCapacity = 0;
    Timestamp updatedAt;

    InventoryUnit() = default;

    InventoryUnit(std::string unitId, int64_t capacity)
        : id(std::move(unitId))
        , availableCapacity(capacity)
        , updatedAt(Timestamp::now())
    {}
};

} // namespace reservation::domain
