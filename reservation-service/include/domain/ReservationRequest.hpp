#pragma once

#include <string>
#include <cstdint>

namespace reservation::domain {

/**
 * @brief Запрос на резервирование ёмкости
 */
struct ReservationRequest {
    std::string unitId;
    std::string bookingId;
    int64_t quantity = 1;
};

} // namespace reservation::domain
