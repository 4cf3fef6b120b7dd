#pragma once

#include <stdexcept>
#include <string>

/**
 * @file StorageException.hpp
 * @brief Исключение хранилища
 */

/**
 * @brief Ошибка транзакционного хранилища (таймаут блокировки, потеря
 *        соединения, нарушение ограничения)
 *
 * Операция, получившая это исключение, откатывается целиком и может быть
 * повторена вызывающей стороной.
 */
class StorageException : public std::runtime_error {
public:
    explicit StorageException(const std::string& message)
        : std::runtime_error(message) {}
};
