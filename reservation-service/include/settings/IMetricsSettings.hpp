#pragma once

#include <string>
#include <vector>

namespace reservation::settings {

/**
 * @brief Определение метрики для Prometheus
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "reservations_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge"
};

/**
 * @brief Интерфейс настроек метрик
 * 
 * Все ключи метрик перечислены заранее: они инициализируются нулями
 * и определяют порядок вывода.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;
    
    /**
     * @brief Определения метрик (для HELP и TYPE)
     */
    virtual std::vector<MetricDefinition> getDefinitions() const = 0;
    
    /**
     * @brief Все ключи метрик с labels
     * 
     * @return Ключи в формате "metric_name{label1=\"value1\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace reservation::settings
