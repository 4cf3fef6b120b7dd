#pragma once

#include "Timestamp.hpp"
#include "enums/ReservationStatus.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace reservation::domain {

/**
 * @brief Резервация ёмкости единицы инвентаря для внешнего бронирования
 *
 * Пока status == PENDING, quantity уже вычтено из availableCapacity
 * единицы и expiresAt заполнено. После выхода из PENDING expiresAt пустое.
 * Записи никогда не удаляются физически.
 */
class Reservation {
public:
    std::string id;
    std::string unitId;
    std::string bookingId;          ///< correlation id внешнего бронирования, не интерпретируется
    int64_t quantity = 1;
    ReservationStatus status = ReservationStatus::PENDING;
    std::optional<Timestamp> expiresAt;
    Timestamp createdAt;
    Timestamp updatedAt;

    Reservation() = default;

    Reservation(
        std::string id,
        std::string unitId,
        std::string bookingId,
        int64_t quantity,
        Timestamp now,
        Timestamp expiresAt)
        : id(std::move(id))
        , unitId(std::move(unitId))
        , bookingId(std::move(bookingId))
        , quantity(quantity)
        , status(ReservationStatus::PENDING)
        , expiresAt(expiresAt)
        , createdAt(now)
        , updatedAt(now)
    {}

    bool isPending() const { return status == ReservationStatus::PENDING; }

    /**
     * @brief Просрочена ли резервация на момент now (строго expiresAt < now)
     */
    bool isOverdue(const Timestamp& now) const {
        return isPending() && expiresAt.has_value() && *expiresAt < now;
    }

    /**
     * @brief Перевести в терминальный статус
     *
     * Вызывающий код обязан проверить isPending() под блокировкой строки.
     */
    void resolve(ReservationStatus terminal, const Timestamp& now) {
        status = terminal;
        expiresAt.reset();
        updatedAt = now;
    }
};

} // namespace reservation::domain
