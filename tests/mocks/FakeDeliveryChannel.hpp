#pragma once

#include "ports/output/IDeliveryChannel.hpp"
#include "ThreadSafeQueue.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace banking::tests::mocks {

/**
 * @brief Канал доставки без брокера
 *
 * deliver() кладёт сообщение, next() забирает; ack/reject записываются
 * для проверок. reject(tag, true) не возвращает сообщение в очередь сам:
 * тест решает, доставлять ли его снова (deliver() с attempt + 1).
 */
class FakeDeliveryChannel : public ports::output::IDeliveryChannel {
public:
    struct Settlement {
        uint64_t deliveryTag;
        enum class Kind { ACK, REQUEUE, DEAD_LETTER } kind;
        bool afterStop = false;    ///< На живом брокере такой ack/reject был бы потерян
    };

    uint64_t deliver(const std::string& payload, uint32_t attempt = 1) {
        ports::output::Delivery delivery;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            delivery.deliveryTag = ++lastTag_;
        }
        delivery.payload = payload;
        delivery.attempt = attempt;
        delivery.redelivered = attempt > 1;
        deliveries_.push(delivery);
        return delivery.deliveryTag;
    }

    std::optional<ports::output::Delivery> next() override {
        return deliveries_.pop();
    }

    void ack(uint64_t deliveryTag) override {
        settle({deliveryTag, Settlement::Kind::ACK});
    }

    void reject(uint64_t deliveryTag, bool requeue) override {
        settle({deliveryTag, requeue ? Settlement::Kind::REQUEUE : Settlement::Kind::DEAD_LETTER});
    }

    void start() override {
        std::lock_guard<std::mutex> lock(mutex_);
        started_ = true;
    }

    void cancel() override {
        deliveries_.shutdown();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        settledCv_.notify_all();
    }

    void stop() override {
        deliveries_.shutdown();
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }

    // Test helpers

    /// Дождаться, пока будет разрешено count доставок
    bool waitForSettlements(size_t count, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return settledCv_.wait_for(lock, timeout, [&] { return settlements_.size() >= count; });
    }

    std::vector<Settlement> settlements() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settlements_;
    }

    size_t count(Settlement::Kind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& s : settlements_) {
            if (s.kind == kind) ++n;
        }
        return n;
    }

    bool isStopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    bool waitForCancel(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return settledCv_.wait_for(lock, timeout, [&] { return cancelled_; });
    }

    size_t settledAfterStop() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& s : settlements_) {
            if (s.afterStop) ++n;
        }
        return n;
    }

private:
    void settle(Settlement settlement) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            settlement.afterStop = stopped_;
            settlements_.push_back(settlement);
        }
        settledCv_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable settledCv_;
    std::vector<Settlement> settlements_;
    uint64_t lastTag_ = 0;
    bool started_ = false;
    bool cancelled_ = false;
    bool stopped_ = false;

    ThreadSafeQueue<ports::output::Delivery> deliveries_;
};

} // namespace banking::tests::mocks
