#pragma once

#include "Timestamp.hpp"
#include "enums/ReservationStatus.hpp"
#include "enums/ReservationError.hpp"
#include <string>

namespace reservation::domain {

/**
 * @brief Результат операции reserve / confirm / cancel
 *
 * Бизнес-исходы не бросают исключений: ошибка передаётся в поле error.
 */
class ReservationResult {
public:
    std::string reservationId;
    ReservationStatus status = ReservationStatus::PENDING;
    ReservationError error = ReservationError::NONE;
    std::string message;
    bool alreadyHandled = false;    ///< cancel: резервация уже была завершена или не найдена
    Timestamp timestamp;

    ReservationResult() : timestamp(Timestamp::now()) {}

    bool ok() const { return error == ReservationError::NONE; }

    static ReservationResult success(
        const std::string& reservationId,
        ReservationStatus status,
        const std::string& message)
    {
        ReservationResult result;
        result.reservationId = reservationId;
        result.status = status;
        result.message = message;
        return result;
    }

    static ReservationResult failure(
        const std::string& reservationId,
        ReservationError error,
        const std::string& message)
    {
        ReservationResult result;
        result.reservationId = reservationId;
        result.error = error;
        result.message = message;
        return result;
    }
};

} // namespace reservation::domain
