// include/settings/ReservationSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace reservation::settings {

/**
 * @brief Настройки движка резерваций
 * 
 * Переменные окружения:
 * - RESERVATION_HOLD_WINDOW_SEC: время удержания pending резервации (900 = 15 минут)
 * - RESERVATION_SWEEP_INTERVAL_SEC: интервал очистки просроченных резерваций (60)
 * - RESERVATION_SWEEPER_ENABLED: запускать ли фоновую очистку (true)
 * - RESERVATION_STORAGE: postgres | memory
 * - RESERVATION_SEED_UNITS: каталог для memory-хранилища, "FL-100:180,FL-200:42"
 * 
 * Некорректные или неположительные числа заменяются значениями по умолчанию.
 * 
 * @example K8s ConfigMap:
 * ```yaml
 * data:
 *   RESERVATION_HOLD_WINDOW_SEC: "900"
 *   RESERVATION_SWEEP_INTERVAL_SEC: "60"
 *   RESERVATION_SWEEPER_ENABLED: "true"
 *   RESERVATION_STORAGE: "postgres"
 * ```
 */
class ReservationSettings {
public:
    static constexpr int64_t DEFAULT_HOLD_WINDOW_SEC = 15 * 60;
    static constexpr int64_t DEFAULT_SWEEP_INTERVAL_SEC = 60;

    ReservationSettings() {
        holdWindowSec_ = getPositiveOrDefault("RESERVATION_HOLD_WINDOW_SEC", DEFAULT_HOLD_WINDOW_SEC);
        sweepIntervalSec_ = getPositiveOrDefault("RESERVATION_SWEEP_INTERVAL_SEC", DEFAULT_SWEEP_INTERVAL_SEC);
        sweeperEnabled_ = getEnvOrDefault("RESERVATION_SWEEPER_ENABLED", "true") == "true";
        storage_ = getEnvOrDefault("RESERVATION_STORAGE", "postgres");
        seedUnits_ = parseSeedUnits(getEnvOrDefault("RESERVATION_SEED_UNITS", ""));
    }

    /**
     * @brief Явные значения без чтения ENV (для тестов)
     */
    static ReservationSettings with(std::chrono::seconds holdWindow, std::chrono::seconds sweepInterval) {
        return ReservationSettings(holdWindow.count(), sweepInterval.count());
    }
    
    std::chrono::milliseconds getHoldWindow() const {
        return std::chrono::seconds{holdWindowSec_};
    }
    
    std::chrono::milliseconds getSweepInterval() const {
        return std::chrono::seconds{sweepIntervalSec_};
    }
    
    bool isSweeperEnabled() const { return sweeperEnabled_; }

    /**
     * @brief Тип хранилища: "postgres" или "memory"
     */
    std::string getStorage() const { return storage_; }

    /**
     * @brief Единицы инвентаря для начальной загрузки memory-хранилища (id, ёмкость)
     */
    const std::vector<std::pair<std::string, int64_t>>& getSeedUnits() const { return seedUnits_; }

    /**
     * @brief Разобрать "id:capacity,id:capacity"; некорректные элементы пропускаются
     */
    static std::vector<std::pair<std::string, int64_t>> parseSeedUnits(const std::string& raw) {
        std::vector<std::pair<std::string, int64_t>> units;
        std::istringstream stream(raw);
        std::string item;
        while (std::getline(stream, item, ',')) {
            auto colon = item.rfind(':');
            if (colon == std::string::npos || colon == 0) {
                if (!item.empty()) {
                    std::cerr << "[ReservationSettings] Skipping seed unit '" << item << "'" << std::endl;
                }
                continue;
            }
            try {
                int64_t capacity = std::stoll(item.substr(colon + 1));
                if (capacity < 0) {
                    throw std::invalid_argument("negative capacity");
                }
                units.emplace_back(item.substr(0, colon), capacity);
            } catch (const std::exception&) {
                std::cerr << "[ReservationSettings] Skipping seed unit '" << item << "'" << std::endl;
            }
        }
        return units;
    }

private:
    // Без чтения ENV, только для with()
    ReservationSettings(int64_t holdWindowSec, int64_t sweepIntervalSec)
        : holdWindowSec_(holdWindowSec)
        , sweepIntervalSec_(sweepIntervalSec)
        , sweeperEnabled_(true)
        , storage_("memory")
    {}

    int64_t holdWindowSec_;
    int64_t sweepIntervalSec_;
    bool sweeperEnabled_;
    std::string storage_;
    std::vector<std::pair<std::string, int64_t>> seedUnits_;
    
    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static int64_t getPositiveOrDefault(const char* name, int64_t defaultValue) {
        const char* raw = std::getenv(name);
        if (!raw) {
            return defaultValue;
        }
        try {
            int64_t parsed = std::stoll(raw);
            if (parsed > 0) {
                return parsed;
            }
        } catch (const std::exception&) {
            // падаем в default ниже
        }
        std::cerr << "[ReservationSettings] Invalid " << name << "='" << raw
                  << "', using default " << defaultValue << std::endl;
        return defaultValue;
    }
};

} // namespace reservation::settings
