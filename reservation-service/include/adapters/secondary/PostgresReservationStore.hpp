// include/adapters/secondary/PostgresReservationStore.hpp
#pragma once

#include "ports/output/IReservationStore.hpp"
#include "ports/output/IReservationTransaction.hpp"
#include "settings/DbSettings.hpp"
#include <StorageException.hpp>
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace reservation::adapters::secondary {

namespace detail {

// Колонки резервации; время хранится как TIMESTAMPTZ, в C++ - epoch millis
inline constexpr const char* RESERVATION_COLUMNS =
    "id, unit_id, booking_id, quantity, status, "
    "(EXTRACT(EPOCH FROM expires_at) * 1000)::BIGINT AS expires_at_ms, "
    "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms, "
    "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms";

inline domain::Reservation toReservation(const pqxx::row& row) {
    domain::Reservation reservation;
    reservation.id = row["id"].as<std::string>();
    reservation.unitId = row["unit_id"].as<std::string>();
    reservation.bookingId = row["booking_id"].as<std::string>();
    reservation.quantity = row["quantity"].as<int64_t>();
    reservation.status = domain::parseReservationStatus(row["status"].as<std::string>());
    if (!row["expires_at_ms"].is_null()) {
        reservation.expiresAt = domain::Timestamp::fromEpochMillis(row["expires_at_ms"].as<int64_t>());
    }
    reservation.createdAt = domain::Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
    reservation.updatedAt = domain::Timestamp::fromEpochMillis(row["updated_at_ms"].as<int64_t>());
    return reservation;
}

inline domain::InventoryUnit toUnit(const pqxx::row& row) {
    domain::InventoryUnit unit;
    unit.id = row["id"].as<std::string>();
    unit.availableCapacity = row["available_capacity"].as<int64_t>();
    unit.updatedAt = domain::Timestamp::fromEpochMillis(row["updated_at_ms"].as<int64_t>());
    return unit;
}

} // namespace detail

/**
 * @brief Транзакция PostgreSQL (одно соединение + pqxx::work)
 *
 * Блокировки строк - SELECT ... FOR UPDATE. pqxx::work откатывается
 * в деструкторе, если commit() не был вызван.
 */
class PostgresReservationTransaction : public ports::output::IReservationTransaction {
public:
    explicit PostgresReservationTransaction(const std::string& connectionString)
        : conn_(connectionString)
        , txn_(conn_)
    {}

    std::optional<domain::InventoryUnit> lockUnit(const std::string& unitId) override {
        auto result = txn_.exec_params(
            "SELECT id, available_capacity, "
            "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms "
            "FROM inventory_units WHERE id = $1 FOR UPDATE",
            unitId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return detail::toUnit(result[0]);
    }

    void adjustCapacity(const std::string& unitId, int64_t delta) override {
        // CHECK (available_capacity >= 0) отклонит уход в минус
        auto result = txn_.exec_params(
            "UPDATE inventory_units "
            "SET available_capacity = available_capacity + $2, updated_at = NOW() "
            "WHERE id = $1",
            unitId,
            delta
        );
        if (result.affected_rows() == 0) {
            throw StorageException("inventory unit not found: " + unitId);
        }
    }

    void insertReservation(const domain::Reservation& reservation) override {
        std::optional<int64_t> expiresAtMs;
        if (reservation.expiresAt) {
            expiresAtMs = reservation.expiresAt->toEpochMillis();
        }
        txn_.exec_params(
            "INSERT INTO reservations "
            "(id, unit_id, booking_id, quantity, status, expires_at, created_at, updated_at) "
            "VALUES ($1, $2, $3, $4, $5, to_timestamp($6 / 1000.0), "
            "to_timestamp($7 / 1000.0), to_timestamp($8 / 1000.0))",
            reservation.id,
            reservation.unitId,
            reservation.bookingId,
            reservation.quantity,
            domain::toString(reservation.status),
            expiresAtMs,
            reservation.createdAt.toEpochMillis(),
            reservation.updatedAt.toEpochMillis()
        );
    }

    std::optional<domain::Reservation> lockReservation(const std::string& reservationId) override {
        auto result = txn_.exec_params(
            std::string("SELECT ") + detail::RESERVATION_COLUMNS +
            " FROM reservations WHERE id = $1 FOR UPDATE",
            reservationId
        );
        if (result.empty()) {
            return std::nullopt;
        }
        return detail::toReservation(result[0]);
    }

    void updateReservation(const domain::Reservation& reservation) override {
        std::optional<int64_t> expiresAtMs;
        if (reservation.expiresAt) {
            expiresAtMs = reservation.expiresAt->toEpochMillis();
        }
        auto result = txn_.exec_params(
            "UPDATE reservations "
            "SET status = $2, expires_at = to_timestamp($3 / 1000.0), updated_at = to_timestamp($4 / 1000.0) "
            "WHERE id = $1",
            reservation.id,
            domain::toString(reservation.status),
            expiresAtMs,
            reservation.updatedAt.toEpochMillis()
        );
        if (result.affected_rows() == 0) {
            throw StorageException("reservation not found: " + reservation.id);
        }
    }

    std::vector<domain::Reservation> lockOverdueReservations(const domain::Timestamp& now) override {
        // READ COMMITTED: после ожидания блокировки WHERE перепроверяется,
        // строки, ушедшие из pending, отбрасываются
        auto result = txn_.exec_params(
            std::string("SELECT ") + detail::RESERVATION_COLUMNS +
            " FROM reservations "
            "WHERE status = 'pending' AND expires_at < to_timestamp($1 / 1000.0) "
            "ORDER BY id FOR UPDATE",
            now.toEpochMillis()
        );

        std::vector<domain::Reservation> reservations;
        reservations.reserve(result.size());
        for (const auto& row : result) {
            reservations.push_back(detail::toReservation(row));
        }
        return reservations;
    }

    void commit() override {
        txn_.commit();
    }

private:
    pqxx::connection conn_;
    pqxx::work txn_;
};

/**
 * @brief PostgreSQL реализация хранилища резерваций
 *
 * Таблица: inventory_units
 * - id VARCHAR(64) PRIMARY KEY
 * - available_capacity BIGINT NOT NULL CHECK (available_capacity >= 0)
 * - updated_at TIMESTAMPTZ
 *
 * Таблица: reservations
 * - id VARCHAR(64) PRIMARY KEY
 * - unit_id VARCHAR(64) REFERENCES inventory_units(id)
 * - booking_id, quantity
 * - status CHECK IN ('pending', 'confirmed', 'cancelled', 'expired')
 * - expires_at TIMESTAMPTZ NULL (только для pending)
 * - created_at, updated_at TIMESTAMPTZ
 * - INDEX (status, expires_at) для очистки просроченных
 */
class PostgresReservationStore : public ports::output::IReservationStore {
public:
    explicit PostgresReservationStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::unique_ptr<ports::output::IReservationTransaction> begin() override {
        return std::make_unique<PostgresReservationTransaction>(settings_->getConnectionString());
    }

    std::optional<domain::InventoryUnit> findUnit(const std::string& unitId) override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT id, available_capacity, "
            "(EXTRACT(EPOCH FROM updated_at) * 1000)::BIGINT AS updated_at_ms "
            "FROM inventory_units WHERE id = $1",
            unitId
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return detail::toUnit(result[0]);
    }

    std::optional<domain::Reservation> findReservation(const std::string& reservationId) override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            std::string("SELECT ") + detail::RESERVATION_COLUMNS +
            " FROM reservations WHERE id = $1",
            reservationId
        );

        if (result.empty()) {
            return std::nullopt;
        }
        return detail::toReservation(result[0]);
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS inventory_units (
                    id VARCHAR(64) PRIMARY KEY,
                    available_capacity BIGINT NOT NULL CHECK (available_capacity >= 0),
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS reservations (
                    id VARCHAR(64) PRIMARY KEY,
                    unit_id VARCHAR(64) NOT NULL REFERENCES inventory_units(id),
                    booking_id VARCHAR(128) NOT NULL,
                    quantity BIGINT NOT NULL CHECK (quantity > 0),
                    status VARCHAR(16) NOT NULL
                        CHECK (status IN ('pending', 'confirmed', 'cancelled', 'expired')),
                    expires_at TIMESTAMPTZ NULL,
                    created_at TIMESTAMPTZ NOT NULL,
                    updated_at TIMESTAMPTZ NOT NULL
                )
            )");

            txn.exec(
                "CREATE INDEX IF NOT EXISTS idx_reservations_status_expires "
                "ON reservations (status, expires_at)"
            );

            txn.commit();
            std::cout << "[PostgresReservationStore] Schema initialized on " << settings_->getName() << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresReservationStore] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace reservation::adapters::secondary
