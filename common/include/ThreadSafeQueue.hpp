#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная блокирующая очередь
 * @details
 * Производитель (I/O поток RabbitMQ) кладёт элементы через push(),
 * потребитель (рабочий поток процессора) забирает их блокирующим pop().
 * После shutdown() pop() дочитывает оставшиеся элементы и затем возвращает std::nullopt.
 */
template <typename T>
class ThreadSafeQueue
{
public:
    ThreadSafeQueue() = default;

    ~ThreadSafeQueue()
    {
        shutdown();
    }

    ThreadSafeQueue(const ThreadSafeQueue &) = delete;
    ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

    /**
     * @brief Добавить элемент в очередь
     * @return false, если очередь уже закрыта
     */
    bool push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_)
                return false;
            queue_.push(std::move(item));
        }
        condVar_.notify_one();
        return true;
    }

    /**
     * @brief Извлечь элемент (блокирующий вызов)
     * @return элемент, либо std::nullopt, если очередь закрыта и пуста
     */
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });
        return takeFront();
    }

    /**
     * @brief Извлечь элемент, ожидая не дольше timeout
     */
    std::optional<T> popFor(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_; });
        return takeFront();
    }

    /**
     * @brief Закрыть очередь и разбудить все ожидающие потоки
     */
    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        condVar_.notify_all();
    }

    bool isShutdown() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    bool isEmpty() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    // Вызывается под mutex_
    std::optional<T> takeFront()
    {
        if (queue_.empty())
            return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool shutdown_ = false;
};
