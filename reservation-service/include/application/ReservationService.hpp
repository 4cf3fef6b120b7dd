// reservation-service/include/application/ReservationService.hpp
#pragma once

#include "ports/input/IReservationService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IReservationStore.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ReservationSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <set>

namespace reservation::application {

/**
 * @brief Движок резерваций инвентаря
 *
 * Единственный писатель availableCapacity и статусов резерваций.
 * Каждая операция - одна транзакция хранилища:
 * - reserve: блокирует единицу, списывает ёмкость, создаёт pending с expiresAt
 * - confirm: блокирует резервацию, pending → confirmed (ёмкость не трогает)
 * - cancel: блокирует резервацию, pending → cancelled и возвращает ёмкость;
 *   отсутствующая или уже завершённая резервация - успех (компенсация
 *   может доставляться повторно)
 * - expireOverdue: все просроченные pending → expired с возвратом ёмкости
 *
 * Ошибки хранилища откатывают транзакцию целиком и возвращаются как
 * STORAGE_FAULT.
 */
class ReservationService : public ports::input::IReservationService {
public:
    ReservationService(
        std::shared_ptr<ports::output::IReservationStore> store,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::ReservationSettings> settings,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : store_(std::move(store))
      , clock_(std::move(clock))
      , settings_(std::move(settings))
      , metrics_(std::move(metrics))
    {
        std::cout << "[ReservationService] Created (hold window "
                  << std::chrono::duration_cast<std::chrono::seconds>(settings_->getHoldWindow()).count()
                  << "s)" << std::endl;
    }

    domain::ReservationResult reserve(const domain::ReservationRequest& request) override {
        // Валидация до открытия транзакции
        if (request.bookingId.empty()) {
            return fail("", domain::ReservationError::INVALID_INPUT, "booking_id is required");
        }
        if (request.unitId.empty()) {
            return fail("", domain::ReservationError::INVALID_INPUT, "unit_id is required");
        }
        if (request.quantity <= 0) {
            return fail("", domain::ReservationError::INVALID_INPUT, "quantity must be positive");
        }

        try {
            auto tx = store_->begin();

            auto unit = tx->lockUnit(request.unitId);
            if (!unit) {
                return fail("", domain::ReservationError::NOT_FOUND,
                            "inventory unit not found: " + request.unitId);
            }
            if (unit->availableCapacity < request.quantity) {
                return fail("", domain::ReservationError::INSUFFICIENT_CAPACITY,
                            "not enough available capacity: requested " + std::to_string(request.quantity) +
                            ", available " + std::to_string(unit->availableCapacity));
            }

            auto now = clock_->now();
            domain::Reservation reservation(
                utils::UuidGenerator::generate(),
                request.unitId,
                request.bookingId,
                request.quantity,
                now,
                now + settings_->getHoldWindow());

            tx->adjustCapacity(request.unitId, -request.quantity);
            tx->insertReservation(reservation);
            tx->commit();

            std::cout << "[ReservationService] Reserved " << reservation.id
                      << " unit=" << request.unitId
                      << " booking=" << request.bookingId
                      << " qty=" << request.quantity
                      << " expires=" << reservation.expiresAt->toString() << std::endl;
            metrics_->increment("reservations_total", {{"outcome", "created"}});

            return domain::ReservationResult::success(
                reservation.id, domain::ReservationStatus::PENDING, "Reservation created");

        } catch (const std::exception& e) {
            return storageFault("", "reserve", e);
        }
    }

    domain::ReservationResult confirm(const std::string& reservationId) override {
        if (reservationId.empty()) {
            return fail("", domain::ReservationError::INVALID_INPUT, "reservation id is required");
        }

        try {
            auto tx = store_->begin();

            auto reservation = tx->lockReservation(reservationId);
            if (!reservation) {
                return fail(reservationId, domain::ReservationError::NOT_FOUND,
                            "reservation not found: " + reservationId);
            }
            if (!reservation->isPending()) {
                auto result = fail(reservationId, domain::ReservationError::INVALID_STATE,
                                   "reservation is " + domain::toString(reservation->status) + ", expected pending");
                result.status = reservation->status;
                return result;
            }

            // Ёмкость списана ещё в reserve и остаётся списанной
            reservation->resolve(domain::ReservationStatus::CONFIRMED, clock_->now());
            tx->updateReservation(*reservation);
            tx->commit();

            std::cout << "[ReservationService] Confirmed " << reservationId << std::endl;
            metrics_->increment("reservations_total", {{"outcome", "confirmed"}});

            return domain::ReservationResult::success(
                reservationId, domain::ReservationStatus::CONFIRMED, "Reservation confirmed");

        } catch (const std::exception& e) {
            return storageFault(reservationId, "confirm", e);
        }
    }

    domain::ReservationResult cancel(const std::string& reservationId) override {
        try {
            auto tx = store_->begin();

            auto reservation = tx->lockReservation(reservationId);
            if (!reservation || !reservation->isPending()) {
                tx->commit();
                std::cout << "[ReservationService] Cancel skipped: " << reservationId
                          << " not found or not pending, assuming already handled" << std::endl;

                auto result = domain::ReservationResult::success(
                    reservationId,
                    reservation ? reservation->status : domain::ReservationStatus::CANCELLED,
                    "Reservation already processed or not found");
                result.alreadyHandled = true;
                return result;
            }

            reservation->resolve(domain::ReservationStatus::CANCELLED, clock_->now());
            tx->updateReservation(*reservation);
            if (tx->lockUnit(reservation->unitId)) {
                tx->adjustCapacity(reservation->unitId, reservation->quantity);
            } else {
                std::cerr << "[ReservationService] Unit " << reservation->unitId
                          << " no longer exists, nothing to release for " << reservationId << std::endl;
            }
            tx->commit();

            std::cout << "[ReservationService] Cancelled (compensation) " << reservationId
                      << " released " << reservation->quantity
                      << " to unit=" << reservation->unitId << std::endl;
            metrics_->increment("reservations_total", {{"outcome", "cancelled"}});

            return domain::ReservationResult::success(
                reservationId, domain::ReservationStatus::CANCELLED, "Reservation cancelled");

        } catch (const std::exception& e) {
            return storageFault(reservationId, "cancel", e);
        }
    }

    domain::SweepReport expireOverdue() override {
        domain::SweepReport report;
        report.startedAt = clock_->now();

        try {
            auto tx = store_->begin();

            auto overdue = tx->lockOverdueReservations(report.startedAt);
            if (overdue.empty()) {
                tx->commit();
                return report;
            }

            // Строки единиц блокируются после строк резерваций, по возрастанию id
            std::set<std::string> unitIds;
            for (const auto& reservation : overdue) {
                unitIds.insert(reservation.unitId);
            }
            std::set<std::string> existingUnits;
            for (const auto& unitId : unitIds) {
                if (tx->lockUnit(unitId)) {
                    existingUnits.insert(unitId);
                }
            }

            int64_t released = 0;
            std::vector<std::string> expiredIds;
            for (auto reservation : overdue) {
                reservation.resolve(domain::ReservationStatus::EXPIRED, report.startedAt);
                tx->updateReservation(reservation);
                if (existingUnits.count(reservation.unitId) > 0) {
                    tx->adjustCapacity(reservation.unitId, reservation.quantity);
                    released += reservation.quantity;
                }
                expiredIds.push_back(reservation.id);
            }
            tx->commit();

            report.expiredIds = std::move(expiredIds);
            report.releasedCapacity = released;
            for (size_t i = 0; i < report.expiredIds.size(); ++i) {
                metrics_->increment("reservations_total", {{"outcome", "expired"}});
            }

        } catch (const std::exception& e) {
            report.failed = true;
            report.errorMessage = e.what();
            report.expiredIds.clear();
            report.releasedCapacity = 0;
        }

        return report;
    }

    std::optional<domain::Reservation> getReservation(const std::string& reservationId) override {
        return store_->findReservation(reservationId);
    }

    std::optional<domain::InventoryUnit> getUnit(const std::string& unitId) override {
        return store_->findUnit(unitId);
    }

private:
    std::shared_ptr<ports::output::IReservationStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::ReservationSettings> settings_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    domain::ReservationResult fail(
        const std::string& reservationId,
        domain::ReservationError error,
        const std::string& message)
    {
        std::cout << "[ReservationService] " << domain::toString(error) << ": " << message << std::endl;
        metrics_->increment("reservation_failures_total", {{"error", domain::toString(error)}});
        return domain::ReservationResult::failure(reservationId, error, message);
    }

    domain::ReservationResult storageFault(
        const std::string& reservationId,
        const char* operation,
        const std::exception& e)
    {
        std::cerr << "[ReservationService] " << operation << " failed, rolled back: " << e.what() << std::endl;
        metrics_->increment("reservation_failures_total",
                            {{"error", domain::toString(domain::ReservationError::STORAGE_FAULT)}});
        return domain::ReservationResult::failure(
            reservationId, domain::ReservationError::STORAGE_FAULT,
            std::string(operation) + " failed: " + e.what());
    }
};

} // namespace reservation::application
