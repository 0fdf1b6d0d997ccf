#pragma once

#include "ports/input/IBalanceMutator.hpp"
#include "ports/output/IDeliveryChannel.hpp"
#include "settings/ProcessorSettings.hpp"
#include "domain/InstructionCodec.hpp"
#include "domain/Errors.hpp"
#include "domain/MutationResult.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <iostream>

namespace banking::application {

/**
 * @brief Чем закончилась обработка одной доставки
 */
enum class DeliveryOutcome {
    ACKNOWLEDGED,    ///< ack: применено или terminal бизнес-отказ
    REQUEUED,        ///< reject(requeue=true): будет повторная доставка
    DEAD_LETTERED    ///< reject(requeue=false): ушло в dead-letter очередь
};

inline std::string toString(DeliveryOutcome outcome) {
    switch (outcome) {
        case DeliveryOutcome::ACKNOWLEDGED: return "ACKNOWLEDGED";
        case DeliveryOutcome::REQUEUED: return "REQUEUED";
        case DeliveryOutcome::DEAD_LETTERED: return "DEAD_LETTERED";
    }
    return "UNKNOWN";
}

/**
 * @brief Снимок счётчиков процессора (для /health)
 */
struct ProcessorStats {
    uint64_t received = 0;
    uint64_t acknowledged = 0;
    uint64_t requeued = 0;
    uint64_t deadLettered = 0;
    uint64_t rejectedTerminal = 0;   ///< ack без применения (ACCOUNT_NOT_FOUND, INSUFFICIENT_BALANCE, BALANCE_OVERFLOW)
};

/**
 * @brief Цикл потребления очереди транзакций
 *
 * Для каждой доставки:
 * Received → Decoding → Applying → {Acknowledged | Requeued | DeadLettered}
 *
 * - APPLIED → ack
 * - ACCOUNT_NOT_FOUND / INSUFFICIENT_BALANCE / BALANCE_OVERFLOW → ack (повтор не поможет)
 * - STORE_UNAVAILABLE, ошибка разбора, неожиданное исключение →
 *   requeue, пока attempt < maxDeliveryAttempts, затем dead-letter
 *
 * Доставки обрабатываются последовательно в одном рабочем потоке.
 *
 * @example
 * ```cpp
 * auto processor = std::make_shared<TransactionProcessor>(channel, mutator, settings);
 * processor->start();
 * // ...
 * processor->stop();
 * ```
 */
class TransactionProcessor {
public:
    TransactionProcessor(
        std::shared_ptr<ports::output::IDeliveryChannel> channel,
        std::shared_ptr<ports::input::IBalanceMutator> mutator,
        std::shared_ptr<settings::ProcessorSettings> settings)
        : channel_(std::move(channel))
        , mutator_(std::move(mutator))
        , settings_(std::move(settings))
        , running_(false)
    {
        std::cout << "[TransactionProcessor] Created, maxDeliveryAttempts="
                  << settings_->getMaxDeliveryAttempts() << std::endl;
    }

    ~TransactionProcessor() {
        stop();
    }

    TransactionProcessor(const TransactionProcessor&) = delete;
    TransactionProcessor& operator=(const TransactionProcessor&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        worker_ = std::thread([this]() { run(); });
        std::cout << "[TransactionProcessor] Started" << std::endl;
    }

    /**
     * @brief Остановить цикл
     *
     * Порядок: cancel() будит next() и прекращает приём, затем рабочий поток
     * дорабатывает текущую доставку и отправляет её ack/reject, и только
     * после этого канал закрывается. Полученные, но не начатые доставки
     * брокер вернёт в очередь сам.
     */
    void stop() {
        if (!running_.exchange(false)) return;

        channel_->cancel();
        if (worker_.joinable()) {
            worker_.join();
        }
        channel_->stop();
        std::cout << "[TransactionProcessor] Stopped" << std::endl;
    }

    bool isRunning() const { return running_; }

    /**
     * @brief Обработать одну доставку и разрешить её через ack/reject
     */
    DeliveryOutcome processDelivery(const ports::output::Delivery& delivery) {
        ++received_;
        if (delivery.redelivered) {
            std::cout << "[TransactionProcessor] Redelivered tag=" << delivery.deliveryTag
                      << " attempt " << delivery.attempt << std::endl;
        }

        std::optional<domain::Instruction> instruction;
        try {
            instruction = domain::InstructionCodec::decode(delivery.payload);
        } catch (const domain::DecodeError& e) {
            std::cerr << "[TransactionProcessor] Undecodable message tag=" << delivery.deliveryTag
                      << ": " << e.what() << std::endl;
            return retryOrDeadLetter(delivery, e.what());
        }

        domain::MutationResult result;
        try {
            result = mutator_->apply(*instruction);
        } catch (const std::exception& e) {
            std::cerr << "[TransactionProcessor] Unexpected error for " << instruction->describe()
                      << ": " << e.what() << std::endl;
            return retryOrDeadLetter(delivery, e.what());
        }

        if (result.isApplied()) {
            channel_->ack(delivery.deliveryTag);
            ++acknowledged_;
            std::cout << "[TransactionProcessor] ACK " << instruction->describe() << std::endl;
            return DeliveryOutcome::ACKNOWLEDGED;
        }

        if (result.isTerminal()) {
            channel_->ack(delivery.deliveryTag);
            ++acknowledged_;
            ++rejectedTerminal_;
            std::cerr << "[TransactionProcessor] WARN " << domain::toString(result.status)
                      << " for " << instruction->describe() << ": " << result.message
                      << " (acknowledged, not retried)" << std::endl;
            return DeliveryOutcome::ACKNOWLEDGED;
        }

        return retryOrDeadLetter(delivery, result.message);
    }

    ProcessorStats getStats() const {
        ProcessorStats stats;
        stats.received = received_;
        stats.acknowledged = acknowledged_;
        stats.requeued = requeued_;
        stats.deadLettered = deadLettered_;
        stats.rejectedTerminal = rejectedTerminal_;
        return stats;
    }

private:
    std::shared_ptr<ports::output::IDeliveryChannel> channel_;
    std::shared_ptr<ports::input::IBalanceMutator> mutator_;
    std::shared_ptr<settings::ProcessorSettings> settings_;

    std::atomic<bool> running_;
    std::thread worker_;

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> acknowledged_{0};
    std::atomic<uint64_t> requeued_{0};
    std::atomic<uint64_t> deadLettered_{0};
    std::atomic<uint64_t> rejectedTerminal_{0};

    void run() {
        while (running_) {
            auto delivery = channel_->next();
            if (!delivery) {
                break;
            }
            try {
                processDelivery(*delivery);
            } catch (const std::exception& e) {
                // ack/reject не дошли до брокера: доставка вернётся после переподключения
                std::cerr << "[TransactionProcessor] Failed to settle tag=" << delivery->deliveryTag
                          << ": " << e.what() << std::endl;
            }
        }
        std::cout << "[TransactionProcessor] Channel closed, worker exiting" << std::endl;
    }

    DeliveryOutcome retryOrDeadLetter(const ports::output::Delivery& delivery, const std::string& reason) {
        const auto maxAttempts = settings_->getMaxDeliveryAttempts();

        if (settings_->isRetryBounded() && delivery.attempt >= maxAttempts) {
            channel_->reject(delivery.deliveryTag, false);
            ++deadLettered_;
            std::cerr << "[TransactionProcessor] DEAD-LETTER tag=" << delivery.deliveryTag
                      << " after " << delivery.attempt << " attempts"
                      << (delivery.redelivered ? " (redelivered)" : "") << ": " << reason << std::endl;
            return DeliveryOutcome::DEAD_LETTERED;
        }

        channel_->reject(delivery.deliveryTag, true);
        ++requeued_;
        std::cerr << "[TransactionProcessor] REQUEUE tag=" << delivery.deliveryTag
                  << " attempt " << delivery.attempt
                  << (delivery.redelivered ? " (redelivered)" : "") << ": " << reason << std::endl;
        return DeliveryOutcome::REQUEUED;
    }
};

} // namespace banking::application
