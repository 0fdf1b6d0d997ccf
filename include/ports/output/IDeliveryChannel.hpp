#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace banking::ports::output {

/**
 * @brief Сообщение, полученное из очереди и ещё не подтверждённое
 */
struct Delivery {
    uint64_t deliveryTag = 0;     ///< Handle для ack/reject
    std::string payload;
    bool redelivered = false;
    uint32_t attempt = 1;         ///< Номер попытки: 1 + x-delivery-count
};

/**
 * @brief Потребительская сторона очереди
 *
 * Ленивая бесконечная последовательность доставок без auto-ack:
 * каждая доставка должна быть разрешена через ack() или reject().
 *
 * @example
 * ```cpp
 * channel->start();
 * while (auto delivery = channel->next()) {
 *     if (process(*delivery)) {
 *         channel->ack(delivery->deliveryTag);
 *     } else {
 *         channel->reject(delivery->deliveryTag, true);
 *     }
 * }
 * ```
 */
class IDeliveryChannel {
public:
    virtual ~IDeliveryChannel() = default;

    /**
     * @brief Дождаться следующей доставки
     * @return std::nullopt только когда канал закрыт
     */
    virtual std::optional<Delivery> next() = 0;

    /**
     * @brief Подтвердить обработку (сообщение удаляется из очереди)
     */
    virtual void ack(uint64_t deliveryTag) = 0;

    /**
     * @brief Отклонить сообщение
     * @param requeue true: вернуть в очередь, false: в dead-letter очередь
     */
    virtual void reject(uint64_t deliveryTag, bool requeue) = 0;

    virtual void start() = 0;

    /**
     * @brief Прекратить получение новых доставок, не закрывая соединение
     *
     * next() дочитывает уже полученное и возвращает std::nullopt.
     * ack() и reject() продолжают работать до stop().
     */
    virtual void cancel() = 0;

    /**
     * @brief Закрыть соединение
     *
     * Неподтверждённые доставки брокер вернёт в очередь.
     */
    virtual void stop() = 0;
};

} // namespace banking::ports::output
