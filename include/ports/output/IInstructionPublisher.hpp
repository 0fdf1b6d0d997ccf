#pragma once

#include "domain/Instruction.hpp"

namespace banking::ports::output {

/**
 * @brief Публикация инструкций в durable-очередь
 *
 * Реализуется RabbitMQAdapter.
 */
class IInstructionPublisher {
public:
    virtual ~IInstructionPublisher() = default;

    /**
     * @brief Опубликовать инструкцию (persistent delivery mode)
     *
     * Возвращает управление только после подтверждения брокером.
     * @throws domain::PublishError если брокер недоступен, ответил nack
     *         или не подтвердил вовремя
     */
    virtual void publish(const domain::Instruction& instruction) = 0;
};

} // namespace banking::ports::output
