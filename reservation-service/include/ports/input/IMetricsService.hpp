#pragma once

#include <string>
#include <map>

namespace reservation::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 * 
 * Счётчики с опциональными labels, сериализуемые в формат Prometheus.
 * 
 * @example
 * ```cpp
 * metrics->increment("reservations_total", {{"outcome", "created"}});
 * metrics->increment("sweeps_total");
 * std::string output = metrics->toPrometheusFormat();
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;
    
    /**
     * @brief Инкрементировать счётчик метрики
     * 
     * @param name Имя метрики (например, "reservations_total")
     * @param labels Опциональные labels в формате {key: value}
     * 
     * @note Ключ метрики формируется как "name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual void increment(
        const std::string& name, 
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Текущее значение счётчика (0 если ключа нет)
     */
    virtual int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const = 0;
    
    /**
     * @brief Сериализовать метрики в Prometheus text format 0.0.4
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace reservation::ports::input
