#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>

namespace reservation::domain {

/**
 * @brief Временная метка (UTC)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}
    
    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Из миллисекунд Unix epoch (формат хранения в БД)
     */
    static Timestamp fromEpochMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(millis)));
    }

    int64_t toEpochMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()).count();
    }

    /**
     * @brief ISO 8601, например 2025-12-15T10:30:00.250Z
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        auto millis = toEpochMillis() % 1000;
        if (millis < 0) millis += 1000;
        
        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
        return ss.str();
    }

    Timestamp operator+(std::chrono::milliseconds delta) const {
        return Timestamp(value + delta);
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator<=(const Timestamp& other) const {
        return value <= other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }
};

} // namespace reservation::domain
