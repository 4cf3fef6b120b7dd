#pragma once

#include "ports/output/IReservationTransaction.hpp"
#include "domain/InventoryUnit.hpp"
#include "domain/Reservation.hpp"
#include <memory>
#include <optional>
#include <string>

namespace reservation::ports::output {

/**
 * @brief Интерфейс хранилища инвентаря и журнала резерваций
 *
 * Единственная точка записи - транзакции, открытые через begin().
 * find*-методы читают последнее зафиксированное состояние без блокировок
 * и годятся только для отображения.
 */
class IReservationStore {
public:
    virtual ~IReservationStore() = default;

    /**
     * @brief Открыть транзакцию
     */
    virtual std::unique_ptr<IReservationTransaction> begin() = 0;

    virtual std::optional<domain::InventoryUnit> findUnit(const std::string& unitId) = 0;

    virtual std::optional<domain::Reservation> findReservation(const std::string& reservationId) = 0;
};

} // namespace reservation::ports::output
