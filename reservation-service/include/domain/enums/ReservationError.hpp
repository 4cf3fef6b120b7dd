#pragma once

#include <string>

namespace reservation::domain {

/**
 * @brief Код ошибки операции движка резерваций
 *
 * - INVALID_INPUT: ошибка вызывающей стороны, транзакция не открывалась
 * - NOT_FOUND: единица инвентаря или резервация не существует
 * - INSUFFICIENT_CAPACITY: не хватает свободной ёмкости
 * - INVALID_STATE: confirm для резервации не в статусе pending
 * - STORAGE_FAULT: сбой транзакции, всё откачено, можно повторить
 */
enum class ReservationError {
    NONE,
    INVALID_INPUT,
    NOT_FOUND,
    INSUFFICIENT_CAPACITY,
    INVALID_STATE,
    STORAGE_FAULT
};

inline std::string toString(ReservationError error) {
    switch (error) {
        case ReservationError::NONE: return "NONE";
        case ReservationError::INVALID_INPUT: return "INVALID_INPUT";
        case ReservationError::NOT_FOUND: return "NOT_FOUND";
        case ReservationError::INSUFFICIENT_CAPACITY: return "INSUFFICIENT_CAPACITY";
        case ReservationError::INVALID_STATE: return "INVALID_STATE";
        case ReservationError::STORAGE_FAULT: return "STORAGE_FAULT";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Можно ли повторить операцию без изменения входных данных
 */
inline bool isRetryable(ReservationError error) {
    return error == ReservationError::STORAGE_FAULT;
}

} // namespace reservation::domain
