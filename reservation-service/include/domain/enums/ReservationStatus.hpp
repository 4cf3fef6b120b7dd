#pragma once

#include <stdexcept>
#include <string>

namespace reservation::domain {

/**
 * @brief Статус резервации
 *
 * PENDING → CONFIRMED | CANCELLED | EXPIRED. Все статусы кроме PENDING
 * терминальные, в PENDING вернуться нельзя.
 */
enum class ReservationStatus {
    PENDING,
    CONFIRMED,
    CANCELLED,
    EXPIRED
};

inline std::string toString(ReservationStatus status) {
    switch (status) {
        case ReservationStatus::PENDING: return "pending";
        case ReservationStatus::CONFIRMED: return "confirmed";
        case ReservationStatus::CANCELLED: return "cancelled";
        case ReservationStatus::EXPIRED: return "expired";
        default: return "unknown";
    }
}

/**
 * @brief Разобрать статус из хранилища
 *
 * @throws std::invalid_argument для неизвестной строки: испорченная запись
 *         не должна стать pending и повторно вернуть ёмкость
 */
inline ReservationStatus parseReservationStatus(const std::string& str) {
    if (str == "pending") return ReservationStatus::PENDING;
    if (str == "confirmed") return ReservationStatus::CONFIRMED;
    if (str == "cancelled") return ReservationStatus::CANCELLED;
    if (str == "expired") return ReservationStatus::EXPIRED;
    throw std::invalid_argument("unknown reservation status: '" + str + "'");
}

inline bool isTerminal(ReservationStatus status) {
    return status != ReservationStatus::PENDING;
}

} // namespace reservation::domain
