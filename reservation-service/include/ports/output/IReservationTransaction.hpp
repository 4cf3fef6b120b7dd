#pragma once

#include "domain/InventoryUnit.hpp"
#include "domain/Reservation.hpp"
#include "domain/Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace reservation::ports::output {

/**
 * @brief Транзакция над таблицами inventory_units и reservations
 *
 * Все lock*-методы берут эксклюзивную блокировку строки до конца
 * транзакции. Если commit() не был вызван, деструктор откатывает все
 * изменения: частичное состояние никогда не становится видимым.
 *
 * Порядок блокировок: сначала строки резерваций, потом строки единиц
 * инвентаря; несколько строк одного вида по возрастанию id.
 *
 * Ошибки хранилища выбрасываются как исключения (StorageException или
 * исключения драйвера БД).
 *
 * @example
 * ```cpp
 * auto tx = store->begin();
 * auto unit = tx->lockUnit(unitId);          // SELECT ... FOR UPDATE
 * tx->adjustCapacity(unitId, -quantity);
 * tx->insertReservation(reservation);
 * tx->commit();
 * ```
 */
class IReservationTransaction {
public:
    virtual ~IReservationTransaction() = default;

    /**
     * @brief Заблокировать строку единицы инвентаря
     * @return std::nullopt если единицы нет
     */
    virtual std::optional<domain::InventoryUnit> lockUnit(const std::string& unitId) = 0;

    /**
     * @brief Изменить свободную ёмкость на delta (строка должна быть заблокирована)
     */
    virtual void adjustCapacity(const std::string& unitId, int64_t delta) = 0;

    /**
     * @brief Вставить новую резервацию
     */
    virtual void insertReservation(const domain::Reservation& reservation) = 0;

    /**
     * @brief Заблокировать строку резервации (в любом статусе)
     * @return std::nullopt если резервации нет
     */
    virtual std::optional<domain::Reservation> lockReservation(const std::string& reservationId) = 0;

    /**
     * @brief Записать status / expiresAt / updatedAt (строка должна быть заблокирована)
     */
    virtual void updateReservation(const domain::Reservation& reservation) = 0;

    /**
     * @brief Заблокировать все pending резервации с expiresAt < now
     *
     * Строки, которые за время ожидания блокировки ушли из pending,
     * в результат не попадают.
     */
    virtual std::vector<domain::Reservation> lockOverdueReservations(const domain::Timestamp& now) = 0;

    /**
     * @brief Зафиксировать транзакцию
     */
    virtual void commit() = 0;
};

} // namespace reservation::ports::output
