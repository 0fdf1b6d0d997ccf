#pragma once

#include "ports/output/IInstructionPublisher.hpp"
#include "ports/output/IDeliveryChannel.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "domain/InstructionCodec.hpp"
#include "domain/Errors.hpp"
#include "ThreadSafeQueue.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <iostream>

namespace banking::adapters::secondary {

/**
 * @brief RabbitMQ адаптер очереди транзакций
 *
 * Реализует IInstructionPublisher и IDeliveryChannel на одном соединении.
 *
 * Топология:
 * - Очередь: durable quorum queue (transaction_queue), публикация через
 *   default exchange с routing key = имя очереди
 * - x-dead-letter-exchange = "", x-dead-letter-routing-key = dead-letter очередь:
 *   reject(tag, false) перекладывает сообщение в transaction_queue.dead
 * - x-delivery-count (quorum) даёт номер попытки доставки
 *
 * Публикация: persistent + publisher confirms, publish() ждёт ack брокера.
 * Потребление: без auto-ack, prefetch из настроек, доставки складываются
 * в ThreadSafeQueue и забираются next() из рабочего потока процессора.
 *
 * Все вызовы AMQP-CPP выполняются в потоке io_context.
 *
 * @example
 * ```cpp
 * auto settings = std::make_shared<RabbitMQSettings>();
 * auto adapter = std::make_shared<RabbitMQAdapter>(settings);
 * adapter->start();
 *
 * adapter->publish(Instruction::deposit("acc-1", Money::fromDouble(50.0)));
 *
 * while (auto delivery = adapter->next()) {
 *     adapter->ack(delivery->deliveryTag);
 * }
 * ```
 */
class RabbitMQAdapter : public ports::output::IInstructionPublisher,
                        public ports::output::IDeliveryChannel {
public:
    explicit RabbitMQAdapter(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , ready_(false)
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
    {
        std::cout << "[RabbitMQAdapter] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " queue=" << settings_->getQueue()
                  << " dlq=" << settings_->getDeadLetterQueue() << std::endl;
    }

    ~RabbitMQAdapter() override {
        stop();
    }

    RabbitMQAdapter(const RabbitMQAdapter&) = delete;
    RabbitMQAdapter& operator=(const RabbitMQAdapter&) = delete;

    // =========================================================================
    // IInstructionPublisher
    // =========================================================================

    /**
     * @brief Опубликовать инструкцию и дождаться подтверждения брокера
     * @throws domain::PublishError nack, потеря сообщения, ошибка канала, таймаут
     */
    void publish(const domain::Instruction& instruction) override {
        if (!running_) {
            throw domain::PublishError("RabbitMQ adapter is not running");
        }

        auto body = domain::InstructionCodec::encode(instruction);
        auto confirm = std::make_shared<PendingConfirm>();
        auto future = confirm->promise.get_future();

        boost::asio::post(ioContext_, [this, body, confirm]() {
            if (!ready_ || !reliable_) {
                confirm->fail("channel not ready");
                return;
            }

            AMQP::Envelope envelope(body.data(), body.size());
            envelope.setPersistent(true);
            envelope.setContentType("application/json");

            reliable_->publish("", settings_->getQueue(), envelope)
                .onAck([confirm]() { confirm->succeed(); })
                .onNack([confirm]() { confirm->fail("broker rejected message"); })
                .onLost([confirm]() { confirm->fail("message lost before confirm"); })
                .onError([confirm](const char* message) {
                    confirm->fail(std::string("channel error: ") + message);
                });
        });

        auto timeout = std::chrono::milliseconds(settings_->getConfirmTimeoutMs());
        if (future.wait_for(timeout) != std::future_status::ready) {
            confirm->fail("confirm timeout");
        }
        future.get();

        std::cout << "[RabbitMQAdapter] Published " << instruction.describe() << std::endl;
    }

    // =========================================================================
    // IDeliveryChannel
    // =========================================================================

    std::optional<ports::output::Delivery> next() override {
        return deliveries_.pop();
    }

    void ack(uint64_t deliveryTag) override {
        boost::asio::post(ioContext_, [this, deliveryTag]() {
            if (!channel_) return;
            channel_->ack(deliveryTag);
        });
    }

    void reject(uint64_t deliveryTag, bool requeue) override {
        boost::asio::post(ioContext_, [this, deliveryTag, requeue]() {
            if (!channel_) return;
            channel_->reject(deliveryTag, requeue ? AMQP::requeue : 0);
        });
    }

    /**
     * @brief Подключиться, объявить очереди и начать потребление
     */
    void start() override {
        if (running_.exchange(true)) return;

        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQAdapter] Worker error: " << e.what() << std::endl;
            }
        });

        std::cout << "[RabbitMQAdapter] Started" << std::endl;
    }

    /**
     * @brief Отменить подписку (basic.cancel), соединение остаётся открытым
     *
     * next() после этого возвращает оставшиеся доставки, затем std::nullopt.
     * ack/reject уже обработанных доставок ещё доходят до брокера.
     */
    void cancel() override {
        deliveries_.shutdown();

        boost::asio::post(ioContext_, [this]() {
            if (!channel_ || consumerTag_.empty()) return;
            const auto tag = consumerTag_;
            consumerTag_.clear();
            channel_->cancel(tag)
                .onSuccess([tag](const std::string&) {
                    std::cout << "[RabbitMQAdapter] Consumer cancelled, tag=" << tag << std::endl;
                })
                .onError([tag](const char* message) {
                    std::cerr << "[RabbitMQAdapter] Cancel error, tag=" << tag << ": " << message << std::endl;
                });
        });
    }

    /**
     * @brief Закрыть соединение
     *
     * Задачи, поставленные в io_context раньше (ack, reject, cancel),
     * выполняются до закрытия.
     */
    void stop() override {
        if (!running_.exchange(false)) return;

        deliveries_.shutdown();

        auto closed = std::make_shared<std::promise<void>>();
        auto closedFuture = closed->get_future();
        boost::asio::post(ioContext_, [this, closed]() {
            ready_ = false;
            if (connection_) {
                connection_->close();
            }
            closed->set_value();
        });
        closedFuture.wait_for(std::chrono::seconds(1));

        workGuard_.reset();
        ioContext_.stop();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        reliable_.reset();
        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQAdapter] Stopped" << std::endl;
    }

private:
    /**
     * @brief Ожидание publisher confirm; разрешается ровно один раз
     */
    struct PendingConfirm {
        std::promise<void> promise;
        std::atomic<bool> settled{false};

        void succeed() {
            if (!settled.exchange(true)) {
                promise.set_value();
            }
        }

        void fail(const std::string& reason) {
            if (!settled.exchange(true)) {
                promise.set_exception(std::make_exception_ptr(domain::PublishError(reason)));
            }
        }
    };

    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_,
            AMQP::Address(settings_->getAddress()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* message) {
            ready_ = false;
            std::cerr << "[RabbitMQAdapter] Channel error: " << message << std::endl;
        });

        reliable_ = std::make_unique<AMQP::Reliable<>>(*channel_);

        channel_->setQos(settings_->getPrefetch())
            .onError([](const char* message) {
                std::cerr << "[RabbitMQAdapter] QoS error: " << message << std::endl;
            });

        declareQueues();
    }

    void declareQueues() {
        const auto dlq = settings_->getDeadLetterQueue();
        const auto queue = settings_->getQueue();

        AMQP::Table dlqArguments;
        dlqArguments["x-queue-type"] = "quorum";

        channel_->declareQueue(dlq, AMQP::durable, dlqArguments)
            .onSuccess([dlq](const std::string&, uint32_t messageCount, uint32_t) {
                std::cout << "[RabbitMQAdapter] Dead-letter queue declared: " << dlq
                          << " (" << messageCount << " messages)" << std::endl;
            })
            .onError([dlq](const char* message) {
                std::cerr << "[RabbitMQAdapter] Dead-letter queue error " << dlq << ": " << message << std::endl;
            });

        AMQP::Table arguments;
        arguments["x-queue-type"] = "quorum";
        arguments["x-dead-letter-exchange"] = "";
        arguments["x-dead-letter-routing-key"] = dlq;

        channel_->declareQueue(queue, AMQP::durable, arguments)
            .onSuccess([this, queue](const std::string&, uint32_t messageCount, uint32_t consumerCount) {
                std::cout << "[RabbitMQAdapter] Queue declared: " << queue
                          << " (" << messageCount << " messages, "
                          << consumerCount << " consumers)" << std::endl;
                ready_ = true;
                startConsuming();
            })
            .onError([queue](const char* message) {
                std::cerr << "[RabbitMQAdapter] Queue error " << queue << ": " << message << std::endl;
            });
    }

    void startConsuming() {
        channel_->consume(settings_->getQueue())
            .onSuccess([this](const std::string& consumerTag) {
                consumerTag_ = consumerTag;
                std::cout << "[RabbitMQAdapter] Consuming, tag=" << consumerTag << std::endl;
            })
            .onReceived([this](const AMQP::Message& message, uint64_t deliveryTag, bool redelivered) {
                ports::output::Delivery delivery;
                delivery.deliveryTag = deliveryTag;
                delivery.payload = std::string(message.body(), message.bodySize());
                delivery.redelivered = redelivered;
                delivery.attempt = attemptOf(message);

                if (!deliveries_.push(std::move(delivery))) {
                    // Канал закрывается: вернуть сообщение брокеру
                    channel_->reject(deliveryTag, AMQP::requeue);
                }
            })
            .onError([](const char* message) {
                std::cerr << "[RabbitMQAdapter] Consume error: " << message << std::endl;
            });
    }

    static uint32_t attemptOf(const AMQP::Message& message) {
        const auto& headers = message.headers();
        if (!headers.contains("x-delivery-count")) {
            return 1;
        }
        auto count = static_cast<int64_t>(headers.get("x-delivery-count"));
        return count > 0 ? static_cast<uint32_t>(count) + 1 : 1;
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;

    std::atomic<bool> running_;
    std::atomic<bool> ready_;
    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;
    std::unique_ptr<AMQP::Reliable<>> reliable_;
    std::string consumerTag_;    ///< Только из потока io_context

    std::thread workerThread_;

    ThreadSafeQueue<ports::output::Delivery> deliveries_;
};

} // namespace banking::adapters::secondary
