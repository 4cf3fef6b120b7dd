#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace reservation::utils {

/**
 * @brief Генератор UUID v4
 * 
 * Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
 * где x - hex digit, y - один из [8, 9, a, b]
 * 
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((high >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((high >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((high & 0x0FFF) | 0x4000) << "-";         // version 4
        ss << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << "-";  // variant
        ss << std::setw(12) << (low & 0xFFFFFFFFFFFF);

        return ss.str();
    }
};

} // namespace reservation::utils
