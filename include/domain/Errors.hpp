#pragma once

#include <stdexcept>
#include <string>

namespace banking::domain {

/**
 * @brief Некорректная форма инструкции или входных данных
 *
 * Возникает до публикации в очередь, никогда не ретраится.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Попытка получить отрицательную сумму
 */
class NegativeBalanceError : public std::domain_error {
public:
    explicit NegativeBalanceError(const std::string& message)
        : std::domain_error(message) {}
};

/**
 * @brief Хранилище временно недоступно
 *
 * Потеря соединения, lock_timeout, deadlock, serialization failure.
 * Безопасно повторить.
 */
class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Брокер не подтвердил публикацию
 *
 * Вызывающий код не должен считать сообщение доставленным.
 */
class PublishError : public std::runtime_error {
public:
    explicit PublishError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Нарушение уникальности (например, телефон уже занят)
 */
class AlreadyExistsError : public std::runtime_error {
public:
    explicit AlreadyExistsError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Тело сообщения из очереди не удалось разобрать
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace banking::domain
