#pragma once

#include "ports/output/IReservationStore.hpp"
#include "ports/output/IReservationTransaction.hpp"
#include <RowLockTable.hpp>
#include <StorageException.hpp>
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace reservation::adapters::secondary {

/**
 * @brief Таблицы in-memory хранилища
 *
 * dataMutex защищает только структуру map (короткие критические секции).
 * Сериализацию изменений одной строки обеспечивают row locks: любой, кто
 * меняет строку, держит её mutex до commit.
 */
struct InMemoryTables {
    mutable std::mutex dataMutex;
    std::unordered_map<std::string, domain::InventoryUnit> units;
    std::unordered_map<std::string, domain::Reservation> reservations;
    RowLockTable<std::string> unitLocks;
    RowLockTable<std::string> reservationLocks;
};

/**
 * @brief Транзакция in-memory хранилища
 *
 * Изменения копятся локально и применяются атомарно в commit().
 * Блокировки строк освобождаются в commit() или в деструкторе (rollback).
 */
class InMemoryReservationTransaction : public ports::output::IReservationTransaction {
public:
    explicit InMemoryReservationTransaction(InMemoryTables& tables)
        : tables_(tables)
    {}

    ~InMemoryReservationTransaction() override {
        if (!committed_ && (!stagedDeltas_.empty() || !stagedReservations_.empty())) {
            std::cout << "[InMemoryReservationStore] Rolled back "
                      << stagedReservations_.size() << " reservation writes" << std::endl;
        }
    }

    InMemoryReservationTransaction(const InMemoryReservationTransaction&) = delete;
    InMemoryReservationTransaction& operator=(const InMemoryReservationTransaction&) = delete;

    std::optional<domain::InventoryUnit> lockUnit(const std::string& unitId) override {
        ensureOpen();
        lockRow(tables_.unitLocks, heldUnitLocks_, unitId);

        std::lock_guard<std::mutex> lock(tables_.dataMutex);
        auto it = tables_.units.find(unitId);
        if (it == tables_.units.end()) {
            return std::nullopt;
        }
        domain::InventoryUnit unit = it->second;
        unit.availableCapacity += stagedDelta(unitId);
        return unit;
    }

    void adjustCapacity(const std::string& unitId, int64_t delta) override {
        ensureOpen();
        requireHeld(heldUnitLocks_, unitId, "inventory unit");

        int64_t committed = 0;
        {
            std::lock_guard<std::mutex> lock(tables_.dataMutex);
            auto it = tables_.units.find(unitId);
            if (it == tables_.units.end()) {
                throw StorageException("inventory unit not found: " + unitId);
            }
            committed = it->second.availableCapacity;
        }

        // аналог CHECK (available_capacity >= 0)
        if (committed + stagedDelta(unitId) + delta < 0) {
            throw StorageException("available capacity would become negative for unit " + unitId);
        }
        stagedDeltas_[unitId] += delta;
    }

    void insertReservation(const domain::Reservation& reservation) override {
        ensureOpen();
        if (stagedReservations_.count(reservation.id) > 0) {
            throw StorageException("duplicate reservation id: " + reservation.id);
        }
        {
            std::lock_guard<std::mutex> lock(tables_.dataMutex);
            if (tables_.reservations.count(reservation.id) > 0) {
                throw StorageException("duplicate reservation id: " + reservation.id);
            }
            if (tables_.units.count(reservation.unitId) == 0) {
                throw StorageException("foreign key violation: unit " + reservation.unitId);
            }
        }
        stagedReservations_[reservation.id] = reservation;
    }

    std::optional<domain::Reservation> lockReservation(const std::string& reservationId) override {
        ensureOpen();
        lockRow(tables_.reservationLocks, heldReservationLocks_, reservationId);
        return readReservation(reservationId);
    }

    void updateReservation(const domain::Reservation& reservation) override {
        ensureOpen();
        requireHeld(heldReservationLocks_, reservation.id, "reservation");
        if (!readReservation(reservation.id)) {
            throw StorageException("reservation not found: " + reservation.id);
        }
        stagedReservations_[reservation.id] = reservation;
    }

    std::vector<domain::Reservation> lockOverdueReservations(const domain::Timestamp& now) override {
        ensureOpen();

        std::vector<std::string> candidates;
        {
            std::lock_guard<std::mutex> lock(tables_.dataMutex);
            for (const auto& [id, reservation] : tables_.reservations) {
                if (reservation.isOverdue(now)) {
                    candidates.push_back(id);
                }
            }
        }
        std::sort(candidates.begin(), candidates.end());

        std::vector<domain::Reservation> locked;
        for (const auto& id : candidates) {
            lockRow(tables_.reservationLocks, heldReservationLocks_, id);

            // Перепроверка под блокировкой: строку мог увести confirm/cancel
            auto current = readReservation(id);
            if (current && current->isOverdue(now)) {
                locked.push_back(*current);
            }
        }
        return locked;
    }

    void commit() override {
        ensureOpen();
        {
            std::lock_guard<std::mutex> lock(tables_.dataMutex);
            for (const auto& [unitId, delta] : stagedDeltas_) {
                auto& unit = tables_.units[unitId];
                unit.availableCapacity += delta;
                unit.updatedAt = domain::Timestamp::now();
            }
            for (const auto& [id, reservation] : stagedReservations_) {
                tables_.reservations[id] = reservation;
            }
        }
        committed_ = true;
        stagedDeltas_.clear();
        stagedReservations_.clear();
        heldReservationLocks_.clear();
        heldUnitLocks_.clear();
    }

private:
    using HeldLocks = std::map<std::string, RowLockTable<std::string>::RowLock>;

    InMemoryTables& tables_;
    bool committed_ = false;
    std::map<std::string, int64_t> stagedDeltas_;
    std::map<std::string, domain::Reservation> stagedReservations_;
    HeldLocks heldReservationLocks_;
    HeldLocks heldUnitLocks_;

    void ensureOpen() const {
        if (committed_) {
            throw StorageException("transaction already committed");
        }
    }

    void lockRow(RowLockTable<std::string>& table, HeldLocks& held, const std::string& id) {
        if (held.count(id) > 0) {
            return;
        }
        held.emplace(id, table.lock(id));
    }

    static void requireHeld(const HeldLocks& held, const std::string& id, const char* what) {
        if (held.count(id) == 0) {
            throw StorageException(std::string(what) + " row is not locked: " + id);
        }
    }

    int64_t stagedDelta(const std::string& unitId) const {
        auto it = stagedDeltas_.find(unitId);
        return it != stagedDeltas_.end() ? it->second : 0;
    }

    std::optional<domain::Reservation> readReservation(const std::string& id) const {
        auto staged = stagedReservations_.find(id);
        if (staged != stagedReservations_.end()) {
            return staged->second;
        }
        std::lock_guard<std::mutex> lock(tables_.dataMutex);
        auto it = tables_.reservations.find(id);
        if (it == tables_.reservations.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/**
 * @brief In-memory реализация хранилища резерваций
 *
 * Используется в тестах и при RESERVATION_STORAGE=memory. Авторитетное
 * состояние процесса: блокировка строки реализована mutex'ом на каждый id.
 */
class InMemoryReservationStore : public ports::output::IReservationStore {
public:
    InMemoryReservationStore() {
        std::cout << "[InMemoryReservationStore] Created" << std::endl;
    }

    std::unique_ptr<ports::output::IReservationTransaction> begin() override {
        return std::make_unique<InMemoryReservationTransaction>(tables_);
    }

    std::optional<domain::InventoryUnit> findUnit(const std::string& unitId) override {
        std::lock_guard<std::mutex> lock(tables_.dataMutex);
        auto it = tables_.units.find(unitId);
        if (it == tables_.units.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::Reservation> findReservation(const std::string& reservationId) override {
        std::lock_guard<std::mutex> lock(tables_.dataMutex);
        auto it = tables_.reservations.find(reservationId);
        if (it == tables_.reservations.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Создать или перезаписать единицу инвентаря (загрузка каталога)
     */
    void putUnit(const domain::InventoryUnit& unit) {
        if (unit.availableCapacity < 0) {
            throw StorageException("available capacity must be non-negative for unit " + unit.id);
        }
        auto rowLock = tables_.unitLocks.lock(unit.id);
        std::lock_guard<std::mutex> lock(tables_.dataMutex);
        tables_.units[unit.id] = unit;
    }

    /**
     * @brief Все резервации единицы (для тестов и аудита)
     */
    std::vector<domain::Reservation> findReservationsByUnit(const std::string& unitId) const {
        std::vector<domain::Reservation> result;
        std::lock_guard<std::mutex> lock(tables_.dataMutex);
        for (const auto& [id, reservation] : tables_.reservations) {
            if (reservation.unitId == unitId) {
                result.push_back(reservation);
            }
        }
        return result;
    }

    /**
     * @brief Число строк, по которым сейчас есть блокировка или ожидание
     */
    size_t lockedRowCount() const {
        return tables_.unitLocks.size() + tables_.reservationLocks.size();
    }

    size_t reservationCount() const {
        std::lock_guard<std::mutex> lock(tables_.dataMutex);
        return tables_.reservations.size();
    }

private:
    InMemoryTables tables_;
};

} // namespace reservation::adapters::secondary
