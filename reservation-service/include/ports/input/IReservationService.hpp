#pragma once

#include "domain/ReservationRequest.hpp"
#include "domain/ReservationResult.hpp"
#include "domain/Reservation.hpp"
#include "domain/InventoryUnit.hpp"
#include "domain/SweepReport.hpp"
#include <optional>
#include <string>

namespace reservation::ports::input {

/**
 * @brief Интерфейс движка резерваций (участник саги бронирования)
 *
 * Оркестратор саги вызывает reserve → затем confirm при успехе всех шагов
 * или cancel как компенсирующее действие. expireOverdue вызывается
 * периодически и возвращает ёмкость брошенных резерваций.
 */
class IReservationService {
public:
    virtual ~IReservationService() = default;

    /**
     * @brief Зарезервировать ёмкость
     *
     * Ошибки: INVALID_INPUT, NOT_FOUND, INSUFFICIENT_CAPACITY, STORAGE_FAULT
     */
    virtual domain::ReservationResult reserve(const domain::ReservationRequest& request) = 0;

    /**
     * @brief Подтвердить резервацию (pending → confirmed)
     *
     * Не идемпотентно: повторный confirm возвращает INVALID_STATE.
     */
    virtual domain::ReservationResult confirm(const std::string& reservationId) = 0;

    /**
     * @brief Отменить резервацию (компенсация)
     *
     * Идемпотентно: отсутствующая или уже завершённая резервация - успех.
     * Ошибка только STORAGE_FAULT.
     */
    virtual domain::ReservationResult cancel(const std::string& reservationId) = 0;

    /**
     * @brief Перевести просроченные pending резервации в expired одной транзакцией
     */
    virtual domain::SweepReport expireOverdue() = 0;

    /**
     * @brief Прочитать резервацию (без блокировки)
     */
    virtual std::optional<domain::Reservation> getReservation(const std::string& reservationId) = 0;

    /**
     * @brief Прочитать единицу инвентаря (без блокировки, неавторитетно)
     */
    virtual std::optional<domain::InventoryUnit> getUnit(const std::string& unitId) = 0;
};

} // namespace reservation::ports::input
