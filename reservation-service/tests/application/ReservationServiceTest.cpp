/**
 * @file ReservationServiceTest.cpp
 * @brief Unit-тесты движка резерваций на InMemoryReservationStore
 */

#include <gtest/gtest.h>
#include "application/ReservationService.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/InMemoryReservationStore.hpp"
#include "settings/MetricsSettings.hpp"
#include "../mocks/FakeClock.hpp"
#include "../mocks/FaultInjectingReservationStore.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace reservation;
using namespace reservation::application;
using namespace reservation::tests;
using namespace std::chrono_literals;

class ReservationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryReservationStore>();
        clock_ = std::make_shared<FakeClock>();
        settings_ = std::make_shared<settings::ReservationSettings>(
            settings::ReservationSettings::with(15min, 60s));
        metrics_ = std::make_shared<MetricsService>(std::make_shared<settings::MetricsSettings>());
        service_ = std::make_shared<ReservationService>(store_, clock_, settings_, metrics_);
    }

    domain::ReservationRequest request(const std::string& unitId, const std::string& bookingId, int64_t quantity) {
        domain::ReservationRequest req;
        req.unitId = unitId;
        req.bookingId = bookingId;
        req.quantity = quantity;
        return req;
    }

    int64_t capacityOf(const std::string& unitId) {
        auto unit = store_->findUnit(unitId);
        return unit ? unit->availableCapacity : -1;
    }

    std::shared_ptr<adapters::secondary::InMemoryReservationStore> store_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<settings::ReservationSettings> settings_;
    std::shared_ptr<MetricsService> metrics_;
    std::shared_ptr<ReservationService> service_;
};

// ============================================================================
// RESERVE
// ============================================================================

TEST_F(ReservationServiceTest, Reserve_CreatesPendingAndDebitsCapacity) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));

    auto result = service_->reserve(request("FL-100", "bk-1", 2));

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.status, domain::ReservationStatus::PENDING);
    EXPECT_FALSE(result.reservationId.empty());
    EXPECT_EQ(capacityOf("FL-100"), 3);

    auto stored = store_->findReservation(result.reservationId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->unitId, "FL-100");
    EXPECT_EQ(stored->bookingId, "bk-1");
    EXPECT_EQ(stored->quantity, 2);
    EXPECT_EQ(stored->status, domain::ReservationStatus::PENDING);
    ASSERT_TRUE(stored->expiresAt.has_value());
    EXPECT_EQ(stored->expiresAt->toEpochMillis(), clock_->now().toEpochMillis() + 15 * 60 * 1000);

    EXPECT_EQ(metrics_->value("reservations_total", {{"outcome", "created"}}), 1);
}

TEST_F(ReservationServiceTest, Reserve_ExactCapacity_LeavesZero) {
    store_->putUnit(domain::InventoryUnit("FL-100", 2));

    auto result = service_->reserve(request("FL-100", "bk-1", 2));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(capacityOf("FL-100"), 0);
}

TEST_F(ReservationServiceTest, Reserve_DuplicateBooking_CreatesSecondReservation) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));

    auto first = service_->reserve(request("FL-100", "bk-1", 1));
    auto second = service_->reserve(request("FL-100", "bk-1", 1));

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_NE(first.reservationId, second.reservationId);
    EXPECT_EQ(capacityOf("FL-100"), 3);
}

TEST_F(ReservationServiceTest, Reserve_InsufficientCapacity_NoSideEffects) {
    store_->putUnit(domain::InventoryUnit("FL-100", 1));

    auto result = service_->reserve(request("FL-100", "bk-1", 2));

    EXPECT_EQ(result.error, domain::ReservationError::INSUFFICIENT_CAPACITY);
    EXPECT_EQ(capacityOf("FL-100"), 1);
    EXPECT_EQ(store_->reservationCount(), 0u);
    EXPECT_EQ(metrics_->value("reservation_failures_total", {{"error", "INSUFFICIENT_CAPACITY"}}), 1);
}

TEST_F(ReservationServiceTest, Reserve_UnknownUnit_NotFound) {
    auto result = service_->reserve(request("NOPE", "bk-1", 1));

    EXPECT_EQ(result.error, domain::ReservationError::NOT_FOUND);
    EXPECT_EQ(store_->reservationCount(), 0u);
}

TEST_F(ReservationServiceTest, Reserve_InvalidInput) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));

    EXPECT_EQ(service_->reserve(request("FL-100", "bk-1", 0)).error, domain::ReservationError::INVALID_INPUT);
    EXPECT_EQ(service_->reserve(request("FL-100", "bk-1", -3)).error, domain::ReservationError::INVALID_INPUT);
    EXPECT_EQ(service_->reserve(request("FL-100", "", 1)).error, domain::ReservationError::INVALID_INPUT);
    EXPECT_EQ(service_->reserve(request("", "bk-1", 1)).error, domain::ReservationError::INVALID_INPUT);

    EXPECT_EQ(capacityOf("FL-100"), 5);
    EXPECT_EQ(store_->reservationCount(), 0u);
}

// ============================================================================
// CONFIRM
// ============================================================================

TEST_F(ReservationServiceTest, Confirm_PendingBecomesConfirmed_CapacityUnchanged) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 2));

    auto result = service_->confirm(reserved.reservationId);

    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.status, domain::ReservationStatus::CONFIRMED);
    EXPECT_EQ(capacityOf("FL-100"), 3);

    auto stored = store_->findReservation(reserved.reservationId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, domain::ReservationStatus::CONFIRMED);
    EXPECT_FALSE(stored->expiresAt.has_value());
}

TEST_F(ReservationServiceTest, Confirm_Twice_SecondIsInvalidState) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 1));

    ASSERT_TRUE(service_->confirm(reserved.reservationId).ok());
    auto second = service_->confirm(reserved.reservationId);

    EXPECT_EQ(second.error, domain::ReservationError::INVALID_STATE);
    EXPECT_EQ(second.status, domain::ReservationStatus::CONFIRMED);
    EXPECT_EQ(capacityOf("FL-100"), 4);
}

TEST_F(ReservationServiceTest, Confirm_Cancelled_InvalidState) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 1));
    ASSERT_TRUE(service_->cancel(reserved.reservationId).ok());

    auto result = service_->confirm(reserved.reservationId);

    EXPECT_EQ(result.error, domain::ReservationError::INVALID_STATE);
    EXPECT_EQ(capacityOf("FL-100"), 5);
}

TEST_F(ReservationServiceTest, Confirm_Unknown_NotFound) {
    auto result = service_->confirm("does-not-exist");
    EXPECT_EQ(result.error, domain::ReservationError::NOT_FOUND);
}

TEST_F(ReservationServiceTest, Confirm_EmptyId_InvalidInput) {
    EXPECT_EQ(service_->confirm("").error, domain::ReservationError::INVALID_INPUT);
}

// ============================================================================
// CANCEL
// ============================================================================

TEST_F(ReservationServiceTest, Cancel_PendingReleasesCapacity) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 3));

    auto result = service_->cancel(reserved.reservationId);

    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.alreadyHandled);
    EXPECT_EQ(result.status, domain::ReservationStatus::CANCELLED);
    EXPECT_EQ(capacityOf("FL-100"), 5);

    auto stored = store_->findReservation(reserved.reservationId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, domain::ReservationStatus::CANCELLED);
    EXPECT_FALSE(stored->expiresAt.has_value());
}

TEST_F(ReservationServiceTest, Cancel_Twice_IsIdempotent) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 3));

    ASSERT_TRUE(service_->cancel(reserved.reservationId).ok());
    auto second = service_->cancel(reserved.reservationId);

    EXPECT_TRUE(second.ok());
    EXPECT_TRUE(second.alreadyHandled);
    EXPECT_EQ(capacityOf("FL-100"), 5);
    EXPECT_EQ(metrics_->value("reservations_total", {{"outcome", "cancelled"}}), 1);
}

TEST_F(ReservationServiceTest, Cancel_Unknown_IsSuccess) {
    auto result = service_->cancel("never-existed");

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.alreadyHandled);
}

TEST_F(ReservationServiceTest, Cancel_Confirmed_DoesNotReleaseCapacity) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 2));
    ASSERT_TRUE(service_->confirm(reserved.reservationId).ok());

    auto result = service_->cancel(reserved.reservationId);

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.alreadyHandled);
    EXPECT_EQ(result.status, domain::ReservationStatus::CONFIRMED);
    EXPECT_EQ(capacityOf("FL-100"), 3);
    EXPECT_EQ(store_->findReservation(reserved.reservationId)->status, domain::ReservationStatus::CONFIRMED);
}

// ============================================================================
// EXPIRY
// ============================================================================

TEST_F(ReservationServiceTest, ExpireOverdue_NotBeforeHoldWindow) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 1));

    clock_->advance(15min);  // ровно expiresAt: ещё не просрочена
    auto report = service_->expireOverdue();

    EXPECT_FALSE(report.failed);
    EXPECT_EQ(report.expiredCount(), 0u);
    EXPECT_EQ(store_->findReservation(reserved.reservationId)->status, domain::ReservationStatus::PENDING);
    EXPECT_EQ(capacityOf("FL-100"), 4);
}

TEST_F(ReservationServiceTest, ExpireOverdue_AfterHoldWindow_ReleasesCapacity) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    store_->putUnit(domain::InventoryUnit("FL-200", 3));
    auto a = service_->reserve(request("FL-100", "bk-1", 2));
    auto b = service_->reserve(request("FL-200", "bk-2", 3));

    clock_->advance(15min + 1ms);
    auto report = service_->expireOverdue();

    EXPECT_FALSE(report.failed);
    EXPECT_EQ(report.expiredCount(), 2u);
    EXPECT_EQ(report.releasedCapacity, 5);
    EXPECT_EQ(capacityOf("FL-100"), 5);
    EXPECT_EQ(capacityOf("FL-200"), 3);

    auto expired = store_->findReservation(a.reservationId);
    EXPECT_EQ(expired->status, domain::ReservationStatus::EXPIRED);
    EXPECT_FALSE(expired->expiresAt.has_value());
    EXPECT_EQ(metrics_->value("reservations_total", {{"outcome", "expired"}}), 2);
}

TEST_F(ReservationServiceTest, ExpireOverdue_SkipsResolvedReservations) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto confirmed = service_->reserve(request("FL-100", "bk-1", 1));
    auto cancelled = service_->reserve(request("FL-100", "bk-2", 1));
    auto pending = service_->reserve(request("FL-100", "bk-3", 1));
    service_->confirm(confirmed.reservationId);
    service_->cancel(cancelled.reservationId);

    clock_->advance(1h);
    auto report = service_->expireOverdue();

    ASSERT_EQ(report.expiredCount(), 1u);
    EXPECT_EQ(report.expiredIds[0], pending.reservationId);
    EXPECT_EQ(capacityOf("FL-100"), 4);
}

TEST_F(ReservationServiceTest, ExpireOverdue_SecondPassIsNoOp) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    service_->reserve(request("FL-100", "bk-1", 2));

    clock_->advance(1h);
    EXPECT_EQ(service_->expireOverdue().expiredCount(), 1u);
    EXPECT_EQ(service_->expireOverdue().expiredCount(), 0u);
    EXPECT_EQ(capacityOf("FL-100"), 5);
}

// ============================================================================
// SAGA SCENARIOS
// ============================================================================

TEST_F(ReservationServiceTest, Scenario_CancelFreesCapacityForNextBooking) {
    store_->putUnit(domain::InventoryUnit("U", 2));

    auto a = service_->reserve(request("U", "A", 2));
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(capacityOf("U"), 0);

    auto b = service_->reserve(request("U", "B", 1));
    EXPECT_EQ(b.error, domain::ReservationError::INSUFFICIENT_CAPACITY);

    ASSERT_TRUE(service_->cancel(a.reservationId).ok());
    EXPECT_EQ(capacityOf("U"), 2);

    auto retry = service_->reserve(request("U", "B", 1));
    EXPECT_TRUE(retry.ok());
    EXPECT_EQ(capacityOf("U"), 1);
}

TEST_F(ReservationServiceTest, Scenario_AbandonedReservationExpiresAndCannotBeConfirmed) {
    store_->putUnit(domain::InventoryUnit("U", 1));

    auto a = service_->reserve(request("U", "A", 1));
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(capacityOf("U"), 0);

    clock_->advance(16min);
    auto report = service_->expireOverdue();
    ASSERT_EQ(report.expiredCount(), 1u);

    EXPECT_EQ(store_->findReservation(a.reservationId)->status, domain::ReservationStatus::EXPIRED);
    EXPECT_EQ(capacityOf("U"), 1);

    auto confirm = service_->confirm(a.reservationId);
    EXPECT_EQ(confirm.error, domain::ReservationError::INVALID_STATE);
    EXPECT_EQ(confirm.status, domain::ReservationStatus::EXPIRED);
}

// ============================================================================
// STORAGE FAULTS
// ============================================================================

class ReservationServiceFaultTest : public ReservationServiceTest {
protected:
    void SetUp() override {
        ReservationServiceTest::SetUp();
        faulty_ = std::make_shared<FaultInjectingReservationStore>(store_);
        faultyService_ = std::make_shared<ReservationService>(faulty_, clock_, settings_, metrics_);
    }

    std::shared_ptr<FaultInjectingReservationStore> faulty_;
    std::shared_ptr<ReservationService> faultyService_;
};

TEST_F(ReservationServiceFaultTest, Reserve_CommitFails_NothingApplied) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    faulty_->failAt(FaultInjectingReservationStore::FailAt::COMMIT);

    auto result = faultyService_->reserve(request("FL-100", "bk-1", 2));

    EXPECT_EQ(result.error, domain::ReservationError::STORAGE_FAULT);
    EXPECT_TRUE(domain::isRetryable(result.error));
    EXPECT_EQ(capacityOf("FL-100"), 5);
    EXPECT_EQ(store_->reservationCount(), 0u);
    EXPECT_EQ(metrics_->value("reservation_failures_total", {{"error", "STORAGE_FAULT"}}), 1);
}

TEST_F(ReservationServiceFaultTest, Reserve_BeginFails_StorageFault) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    faulty_->failAt(FaultInjectingReservationStore::FailAt::BEGIN);

    EXPECT_EQ(faultyService_->reserve(request("FL-100", "bk-1", 1)).error,
              domain::ReservationError::STORAGE_FAULT);
    EXPECT_EQ(capacityOf("FL-100"), 5);
}

TEST_F(ReservationServiceFaultTest, Reserve_AfterFault_RowLocksReleased) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    faulty_->failAt(FaultInjectingReservationStore::FailAt::WRITE);
    EXPECT_EQ(faultyService_->reserve(request("FL-100", "bk-1", 1)).error,
              domain::ReservationError::STORAGE_FAULT);

    faulty_->failAt(FaultInjectingReservationStore::FailAt::NONE);
    auto retry = faultyService_->reserve(request("FL-100", "bk-1", 1));

    EXPECT_TRUE(retry.ok());
    EXPECT_EQ(capacityOf("FL-100"), 4);
}

TEST_F(ReservationServiceFaultTest, Confirm_CommitFails_StaysPending) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 1));
    faulty_->failAt(FaultInjectingReservationStore::FailAt::COMMIT);

    auto result = faultyService_->confirm(reserved.reservationId);

    EXPECT_EQ(result.error, domain::ReservationError::STORAGE_FAULT);
    EXPECT_EQ(store_->findReservation(reserved.reservationId)->status, domain::ReservationStatus::PENDING);
}

TEST_F(ReservationServiceFaultTest, Cancel_CommitFails_CapacityNotReleased) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 2));
    faulty_->failAt(FaultInjectingReservationStore::FailAt::COMMIT);

    auto result = faultyService_->cancel(reserved.reservationId);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, domain::ReservationError::STORAGE_FAULT);
    EXPECT_EQ(capacityOf("FL-100"), 3);
    EXPECT_EQ(store_->findReservation(reserved.reservationId)->status, domain::ReservationStatus::PENDING);
}

TEST_F(ReservationServiceFaultTest, ExpireOverdue_CommitFails_ReportsFailureAndRetriesNextPass) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    service_->reserve(request("FL-100", "bk-1", 2));
    clock_->advance(1h);
    faulty_->failAt(FaultInjectingReservationStore::FailAt::COMMIT);

    auto failed = faultyService_->expireOverdue();

    EXPECT_TRUE(failed.failed);
    EXPECT_FALSE(failed.errorMessage.empty());
    EXPECT_EQ(failed.expiredCount(), 0u);
    EXPECT_EQ(capacityOf("FL-100"), 3);

    faulty_->failAt(FaultInjectingReservationStore::FailAt::NONE);
    auto retried = faultyService_->expireOverdue();

    EXPECT_FALSE(retried.failed);
    EXPECT_EQ(retried.expiredCount(), 1u);
    EXPECT_EQ(capacityOf("FL-100"), 5);
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(ReservationServiceTest, Concurrent_Reserve_NeverOversells) {
    constexpr int CAPACITY = 50;
    constexpr int THREADS = 8;
    constexpr int ATTEMPTS_PER_THREAD = 20;
    store_->putUnit(domain::InventoryUnit("FL-100", CAPACITY));

    std::atomic<int> succeeded{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < ATTEMPTS_PER_THREAD; ++i) {
                auto result = service_->reserve(
                    request("FL-100", "bk-" + std::to_string(t) + "-" + std::to_string(i), 1));
                if (result.ok()) {
                    ++succeeded;
                } else if (result.error == domain::ReservationError::INSUFFICIENT_CAPACITY) {
                    ++rejected;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), CAPACITY);
    EXPECT_EQ(rejected.load(), THREADS * ATTEMPTS_PER_THREAD - CAPACITY);
    EXPECT_EQ(capacityOf("FL-100"), 0);
    EXPECT_EQ(store_->findReservationsByUnit("FL-100").size(), static_cast<size_t>(CAPACITY));
}

TEST_F(ReservationServiceTest, Concurrent_CancelAndSweep_ReleaseExactlyOnce) {
    constexpr int RESERVATIONS = 40;
    store_->putUnit(domain::InventoryUnit("FL-100", RESERVATIONS));

    std::vector<std::string> ids;
    for (int i = 0; i < RESERVATIONS; ++i) {
        auto result = service_->reserve(request("FL-100", "bk-" + std::to_string(i), 1));
        ASSERT_TRUE(result.ok());
        ids.push_back(result.reservationId);
    }
    ASSERT_EQ(capacityOf("FL-100"), 0);

    clock_->advance(1h);

    std::thread canceller([&]() {
        for (const auto& id : ids) {
            EXPECT_TRUE(service_->cancel(id).ok());
        }
    });
    std::thread sweeper([&]() {
        for (int i = 0; i < 5; ++i) {
            EXPECT_FALSE(service_->expireOverdue().failed);
        }
    });
    canceller.join();
    sweeper.join();

    EXPECT_EQ(capacityOf("FL-100"), RESERVATIONS);
    for (const auto& id : ids) {
        auto status = store_->findReservation(id)->status;
        EXPECT_TRUE(status == domain::ReservationStatus::CANCELLED ||
                    status == domain::ReservationStatus::EXPIRED);
    }
    EXPECT_EQ(metrics_->value("reservations_total", {{"outcome", "cancelled"}}) +
              metrics_->value("reservations_total", {{"outcome", "expired"}}),
              RESERVATIONS);
}

TEST_F(ReservationServiceTest, Concurrent_ConfirmAndCancel_ExactlyOneWins) {
    store_->putUnit(domain::InventoryUnit("FL-100", 10));

    for (int i = 0; i < 20; ++i) {
        auto reserved = service_->reserve(request("FL-100", "bk-" + std::to_string(i), 1));
        ASSERT_TRUE(reserved.ok());

        domain::ReservationResult confirmResult;
        domain::ReservationResult cancelResult;
        std::thread confirmer([&]() { confirmResult = service_->confirm(reserved.reservationId); });
        std::thread canceller([&]() { cancelResult = service_->cancel(reserved.reservationId); });
        confirmer.join();
        canceller.join();

        auto status = store_->findReservation(reserved.reservationId)->status;
        if (status == domain::ReservationStatus::CONFIRMED) {
            EXPECT_TRUE(confirmResult.ok());
            EXPECT_TRUE(cancelResult.alreadyHandled);
            // подтверждённая держит ёмкость - освобождаем для следующей итерации
            store_->putUnit(domain::InventoryUnit("FL-100", 10));
        } else {
            EXPECT_EQ(status, domain::ReservationStatus::CANCELLED);
            EXPECT_EQ(confirmResult.error, domain::ReservationError::INVALID_STATE);
            EXPECT_FALSE(cancelResult.alreadyHandled);
        }
        EXPECT_EQ(capacityOf("FL-100"), 10);
    }
}

// ============================================================================
// ROW LOCK TABLE FOOTPRINT
// ============================================================================

TEST_F(ReservationServiceTest, LookupsOfMissingIds_LeaveNoLockEntries) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));

    for (int i = 0; i < 2000; ++i) {
        auto id = std::to_string(i);
        EXPECT_TRUE(service_->cancel("bogus-" + id).alreadyHandled);
        EXPECT_EQ(service_->confirm("nope-" + id).error, domain::ReservationError::NOT_FOUND);
        EXPECT_EQ(service_->reserve(request("NO-UNIT-" + id, "bk-" + id, 1)).error,
                  domain::ReservationError::NOT_FOUND);
    }

    EXPECT_EQ(store_->lockedRowCount(), 0u);
    EXPECT_EQ(store_->reservationCount(), 0u);
}

TEST_F(ReservationServiceTest, CompletedOperations_ReleaseAllRowLocks) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));

    auto confirmed = service_->reserve(request("FL-100", "bk-1", 1));
    auto cancelled = service_->reserve(request("FL-100", "bk-2", 1));
    service_->reserve(request("FL-100", "bk-3", 1));
    service_->confirm(confirmed.reservationId);
    service_->cancel(cancelled.reservationId);
    service_->reserve(request("FL-100", "bk-4", 100));
    clock_->advance(1h);
    service_->expireOverdue();

    EXPECT_EQ(store_->lockedRowCount(), 0u);
}

// ============================================================================
// LOCK FAULTS
// ============================================================================

TEST_F(ReservationServiceFaultTest, InvalidInput_NeverOpensTransaction) {
    faultyService_->reserve(request("FL-100", "", 1));
    faultyService_->reserve(request("FL-100", "bk-1", 0));
    faultyService_->confirm("");

    EXPECT_EQ(faulty_->beginCallCount(), 0);
}

TEST_F(ReservationServiceFaultTest, Reserve_LockTimeout_NothingChanged) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    faulty_->failAt(FaultInjectingReservationStore::FailAt::LOCK);

    auto result = faultyService_->reserve(request("FL-100", "bk-1", 2));

    EXPECT_EQ(result.error, domain::ReservationError::STORAGE_FAULT);
    EXPECT_NE(result.message.find("lock timeout"), std::string::npos);
    EXPECT_EQ(faulty_->beginCallCount(), 1);
    EXPECT_EQ(capacityOf("FL-100"), 5);
    EXPECT_EQ(store_->reservationCount(), 0u);
    EXPECT_EQ(store_->lockedRowCount(), 0u);
}

TEST_F(ReservationServiceFaultTest, Cancel_LockTimeout_IsStorageFaultNotAlreadyHandled) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 2));
    faulty_->failAt(FaultInjectingReservationStore::FailAt::LOCK);

    auto result = faultyService_->cancel(reserved.reservationId);

    EXPECT_EQ(result.error, domain::ReservationError::STORAGE_FAULT);
    EXPECT_FALSE(result.alreadyHandled);
    EXPECT_EQ(capacityOf("FL-100"), 3);
    EXPECT_EQ(store_->findReservation(reserved.reservationId)->status, domain::ReservationStatus::PENDING);
    EXPECT_EQ(store_->lockedRowCount(), 0u);

    faulty_->failAt(FaultInjectingReservationStore::FailAt::NONE);
    EXPECT_FALSE(faultyService_->cancel(reserved.reservationId).alreadyHandled);
    EXPECT_EQ(capacityOf("FL-100"), 5);
}

TEST_F(ReservationServiceFaultTest, Cancel_WriteFailsAfterLock_RowLockReleased) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 2));
    faulty_->failAt(FaultInjectingReservationStore::FailAt::WRITE);

    EXPECT_EQ(faultyService_->cancel(reserved.reservationId).error, domain::ReservationError::STORAGE_FAULT);

    EXPECT_EQ(store_->lockedRowCount(), 0u);
    EXPECT_EQ(capacityOf("FL-100"), 3);
    // строка не осталась заблокированной: обычный confirm проходит
    EXPECT_TRUE(service_->confirm(reserved.reservationId).ok());
}

TEST_F(ReservationServiceFaultTest, ExpireOverdue_LockTimeout_ReportsFailureAndKeepsPending) {
    store_->putUnit(domain::InventoryUnit("FL-100", 5));
    auto reserved = service_->reserve(request("FL-100", "bk-1", 2));
    clock_->advance(1h);
    faulty_->failAt(FaultInjectingReservationStore::FailAt::LOCK);

    auto report = faultyService_->expireOverdue();

    EXPECT_TRUE(report.failed);
    EXPECT_EQ(report.errorMessage, "lock timeout");
    EXPECT_EQ(report.expiredCount(), 0u);
    EXPECT_EQ(report.releasedCapacity, 0);
    EXPECT_EQ(capacityOf("FL-100"), 3);
    EXPECT_EQ(store_->findReservation(reserved.reservationId)->status, domain::ReservationStatus::PENDING);
    EXPECT_EQ(store_->lockedRowCount(), 0u);
}
