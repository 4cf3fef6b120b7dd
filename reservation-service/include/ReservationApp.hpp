// include/ReservationApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/ReservationSettings.hpp"
#include "settings/MetricsSettings.hpp"
#include "settings/ServerSettings.hpp"

// Ports
#include "ports/input/IReservationService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IReservationStore.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/ReservationService.hpp"
#include "application/ExpirySweeper.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresReservationStore.hpp"
#include "adapters/secondary/InMemoryReservationStore.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "adapters/primary/CreateReservationHandler.hpp"
#include "adapters/primary/ConfirmReservationHandler.hpp"
#include "adapters/primary/CancelReservationHandler.hpp"
#include "adapters/primary/GetReservationHandler.hpp"
#include "adapters/primary/GetUnitHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace reservation {

/**
 * @brief Reservation Service Application
 * 
 * Участник саги бронирования: владеет ёмкостью единиц инвентаря.
 * HTTP: POST/PATCH/DELETE /api/v1/reservations (reserve / confirm / cancel)
 * Фон: ExpirySweeper возвращает ёмкость просроченных pending резерваций.
 */
class ReservationApp : public BoostBeastApplication {
public:
    ReservationApp() { std::cout << "[ReservationApp] Initializing..." << std::endl; }

    ~ReservationApp() override {
        stopBackgroundTasks();
        std::cout << "[ReservationApp] Shutting down..." << std::endl;
    }

    /**
     * @brief Остановить фоновые задачи (вызывается при shutdown процесса)
     */
    void stopBackgroundTasks() {
        if (sweeper_) {
            sweeper_->stop();
        }
    }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);

        settings::ServerSettings server;
        std::cout << "[ReservationApp] Environment loaded, listening on "
                  << server.getHost() << ":" << server.getPort() << std::endl;
    }

    void configureInjection() override {
        std::cout << "[ReservationApp] Configuring DI..." << std::endl;

        // Шаг 1: Хранилище выбирается по RESERVATION_STORAGE, один экземпляр на процесс
        auto reservationSettings = std::make_shared<settings::ReservationSettings>();
        auto store = createStore(reservationSettings);

        // Шаг 2: Основной injector с instance binding для хранилища
        auto injector = di::make_injector(
            di::bind<settings::ReservationSettings>().to(reservationSettings),
            di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),
            di::bind<ports::output::IReservationStore>().to(store),
            di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),
            di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),
            di::bind<ports::input::IReservationService>().to<application::ReservationService>().in(di::singleton)
        );

        auto metrics = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
        auto withMetrics = [&metrics](std::shared_ptr<IHttpHandler> handler) {
            return std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics);
        };

        // Шаг 3: HTTP Handlers
        registerEndpoint("GET", "/health", withMetrics(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>()));
        registerEndpoint("GET", "/metrics", withMetrics(injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>()));

        registerEndpoint("POST", "/api/v1/reservations",
                         withMetrics(injector.create<std::shared_ptr<adapters::primary::CreateReservationHandler>>()));
        registerEndpoint("PATCH", "/api/v1/reservations/*",
                         withMetrics(injector.create<std::shared_ptr<adapters::primary::ConfirmReservationHandler>>()));
        registerEndpoint("DELETE", "/api/v1/reservations/*",
                         withMetrics(injector.create<std::shared_ptr<adapters::primary::CancelReservationHandler>>()));
        registerEndpoint("GET", "/api/v1/reservations/*",
                         withMetrics(injector.create<std::shared_ptr<adapters::primary::GetReservationHandler>>()));
        registerEndpoint("GET", "/api/v1/units/*",
                         withMetrics(injector.create<std::shared_ptr<adapters::primary::GetUnitHandler>>()));

        // Шаг 4: Очистка просроченных резерваций (владелец - приложение)
        sweeper_ = injector.create<std::shared_ptr<application::ExpirySweeper>>();
        if (reservationSettings->isSweeperEnabled()) {
            sweeper_->start();
            std::cout << "[ReservationApp] Expiry sweeper started" << std::endl;
        } else {
            std::cout << "[ReservationApp] Expiry sweeper disabled (RESERVATION_SWEEPER_ENABLED=false)" << std::endl;
        }

        std::cout << "[ReservationApp] Ready" << std::endl;
    }

private:
    std::shared_ptr<application::ExpirySweeper> sweeper_;

    static std::shared_ptr<ports::output::IReservationStore> createStore(
        const std::shared_ptr<settings::ReservationSettings>& reservationSettings)
    {
        if (reservationSettings->getStorage() == "memory") {
            auto memoryStore = std::make_shared<adapters::secondary::InMemoryReservationStore>();
            for (const auto& [unitId, capacity] : reservationSettings->getSeedUnits()) {
                memoryStore->putUnit(domain::InventoryUnit(unitId, capacity));
                std::cout << "[ReservationApp] Seeded unit " << unitId << " capacity=" << capacity << std::endl;
            }
            return memoryStore;
        }

        auto dbInjector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton));
        return dbInjector.create<std::shared_ptr<adapters::secondary::PostgresReservationStore>>();
    }
};

} // namespace reservation
