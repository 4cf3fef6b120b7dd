#pragma once

#include "adapters/secondary/InMemoryReservationStore.hpp"
#include <StorageException.hpp>
#include <atomic>
#include <memory>

namespace reservation::tests {

/**
 * @brief Хранилище, которое роняет транзакцию на выбранном шаге
 *
 * Делегирует InMemoryReservationStore; позволяет проверить, что при сбое
 * всё откатывается и возвращается STORAGE_FAULT.
 */
class FaultInjectingReservationStore : public ports::output::IReservationStore {
public:
    enum class FailAt {
        NONE,
        BEGIN,
        LOCK,
        WRITE,
        COMMIT
    };

    explicit FaultInjectingReservationStore(std::shared_ptr<adapters::secondary::InMemoryReservationStore> inner)
        : inner_(std::move(inner))
    {}

    void failAt(FailAt step) { failAt_ = step; }

    int beginCallCount() const { return beginCallCount_; }

    std::unique_ptr<ports::output::IReservationTransaction> begin() override {
        ++beginCallCount_;
        if (failAt_ == FailAt::BEGIN) {
            throw StorageException("connection refused");
        }
        return std::make_unique<Transaction>(inner_->begin(), failAt_);
    }

    std::optional<domain::InventoryUnit> findUnit(const std::string& unitId) override {
        return inner_->findUnit(unitId);
    }

    std::optional<domain::Reservation> findReservation(const std::string& reservationId) override {
        return inner_->findReservation(reservationId);
    }

private:
    class Transaction : public ports::output::IReservationTransaction {
    public:
        Transaction(std::unique_ptr<ports::output::IReservationTransaction> inner, FailAt failAt)
            : inner_(std::move(inner)), failAt_(failAt)
        {}

        std::optional<domain::InventoryUnit> lockUnit(const std::string& unitId) override {
            maybeFail(FailAt::LOCK, "lock timeout");
            return inner_->lockUnit(unitId);
        }

        void adjustCapacity(const std::string& unitId, int64_t delta) override {
            inner_->adjustCapacity(unitId, delta);
        }

        void insertReservation(const domain::Reservation& reservation) override {
            maybeFail(FailAt::WRITE, "disk full");
            inner_->insertReservation(reservation);
        }

        std::optional<domain::Reservation> lockReservation(const std::string& reservationId) override {
            maybeFail(FailAt::LOCK, "lock timeout");
            return inner_->lockReservation(reservationId);
        }

        void updateReservation(const domain::Reservation& reservation) override {
            maybeFail(FailAt::WRITE, "disk full");
            inner_->updateReservation(reservation);
        }

        std::vector<domain::Reservation> lockOverdueReservations(const domain::Timestamp& now) override {
            maybeFail(FailAt::LOCK, "lock timeout");
            return inner_->lockOverdueReservations(now);
        }

        void commit() override {
            maybeFail(FailAt::COMMIT, "connection lost during commit");
            inner_->commit();
        }

    private:
        std::unique_ptr<ports::output::IReservationTransaction> inner_;
        FailAt failAt_;

        void maybeFail(FailAt step, const char* message) const {
            if (failAt_ == step) {
                throw StorageException(message);
            }
        }
    };

    std::shared_ptr<adapters::secondary::InMemoryReservationStore> inner_;
    std::atomic<FailAt> failAt_{FailAt::NONE};
    std::atomic<int> beginCallCount_{0};
};

} // namespace reservation::tests
