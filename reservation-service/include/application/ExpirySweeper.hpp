#pragma once

#include "ports/input/IReservationService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "settings/ReservationSettings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace reservation::application {

/**
 * @brief Фоновая очистка просроченных резерваций
 *
 * Раз в интервал вызывает IReservationService::expireOverdue(). Ошибка
 * прохода логируется и не пробрасывается: необработанные резервации
 * останутся pending до следующего тика.
 *
 * Запуск и остановка - ответственность владельца (приложения).
 * stop() будит спящий поток сразу, не дожидаясь конца интервала.
 */
class ExpirySweeper {
public:
    ExpirySweeper(
        std::shared_ptr<ports::input::IReservationService> reservationService,
        std::shared_ptr<settings::ReservationSettings> settings,
        std::shared_ptr<ports::input::IMetricsService> metrics)
        : reservationService_(std::move(reservationService))
        , metrics_(std::move(metrics))
        , interval_(settings->getSweepInterval())
        , running_(false)
        , tickCount_(0)
    {
        std::cout << "[ExpirySweeper] Created (interval "
                  << std::chrono::duration_cast<std::chrono::seconds>(interval_).count()
                  << "s)" << std::endl;
    }

    ~ExpirySweeper() {
        stop();
    }

    // Non-copyable, non-movable
    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    void setInterval(std::chrono::milliseconds interval) {
        std::lock_guard<std::mutex> lock(mutex_);
        interval_ = interval;
    }

    void start() {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() {
            std::cout << "[ExpirySweeper] Started" << std::endl;
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_) {
                // Первый проход через interval после старта
                wakeUp_.wait_for(lock, interval_, [this]() { return !running_; });
                if (!running_) break;

                lock.unlock();
                sweepOnce();
                lock.lock();
            }
            std::cout << "[ExpirySweeper] Stopped" << std::endl;
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        wakeUp_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool isRunning() const { return running_; }

    uint64_t getTickCount() const { return tickCount_; }

    /**
     * @brief Выполнить один проход синхронно (тик таймера и тесты)
     */
    domain::SweepReport sweepOnce() {
        domain::SweepReport report;
        try {
            report = reservationService_->expireOverdue();
        } catch (const std::exception& e) {
            report.failed = true;
            report.errorMessage = e.what();
        }

        if (report.failed) {
            std::cerr << "[ExpirySweeper] Reservation cleanup error: " << report.errorMessage << std::endl;
            metrics_->increment("sweep_failures_total");
        } else {
            metrics_->increment("sweeps_total");
            if (report.expiredCount() > 0) {
                std::cout << "[ExpirySweeper] Expired " << report.expiredCount()
                          << " reservations, released " << report.releasedCapacity << std::endl;
            }
        }

        ++tickCount_;
        return report;
    }

private:
    std::shared_ptr<ports::input::IReservationService> reservationService_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeUp_;
};

} // namespace reservation::application
