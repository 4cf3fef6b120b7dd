#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace reservation::settings {

/**
 * @brief Настройки метрик Reservation Service
 * 
 * - HTTP метрики (запросы к endpoints)
 * - Бизнес метрики (исходы резерваций, ошибки по кодам)
 * - Метрики очистки просроченных резерваций
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"reservations_total", "Reservation state transitions by outcome", "counter"},
            {"reservation_failures_total", "Failed reservation operations by error code", "counter"},
            {"sweeps_total", "Completed expiry sweeps", "counter"},
            {"sweep_failures_total", "Failed expiry sweeps", "counter"}
        };
    }
    
    std::vector<std::string> getAllKeys() const override {
        return {
            // ============================================
            // HTTP метрики (method + path)
            // ============================================
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/reservations\"}",
            "http_requests_total{method=\"PATCH\",path=\"/api/v1/reservations\"}",
            "http_requests_total{method=\"DELETE\",path=\"/api/v1/reservations\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/reservations\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/units\"}",
            
            // ============================================
            // Бизнес метрики
            // ============================================
            "reservations_total{outcome=\"created\"}",
            "reservations_total{outcome=\"confirmed\"}",
            "reservations_total{outcome=\"cancelled\"}",
            "reservations_total{outcome=\"expired\"}",

            "reservation_failures_total{error=\"INVALID_INPUT\"}",
            "reservation_failures_total{error=\"NOT_FOUND\"}",
            "reservation_failures_total{error=\"INSUFFICIENT_CAPACITY\"}",
            "reservation_failures_total{error=\"INVALID_STATE\"}",
            "reservation_failures_total{error=\"STORAGE_FAULT\"}",

            // ============================================
            // Sweeper
            // ============================================
            "sweeps_total",
            "sweep_failures_total"
        };
    }
};

} // namespace reservation::settings
