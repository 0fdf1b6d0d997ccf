#pragma once

#include <string>
#include <cstdlib>
#include <cstdint>

namespace banking::settings {

/**
 * @brief Настройки RabbitMQ
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER (default: "guest")
 * - RABBITMQ_PASSWORD (default: "guest")
 * - RABBITMQ_VHOST (default: "/")
 * - RABBITMQ_QUEUE (default: "transaction_queue")
 * - RABBITMQ_DEAD_LETTER_QUEUE (default: "transaction_queue.dead")
 * - RABBITMQ_PREFETCH (default: 1)
 * - RABBITMQ_CONFIRM_TIMEOUT_MS (default: 5000)
 * - RABBITMQ_URI: если задан, заменяет собранный адрес
 */
class RabbitMQSettings {
public:
    RabbitMQSettings() {
        if (const char* host = std::getenv("RABBITMQ_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("RABBITMQ_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* user = std::getenv("RABBITMQ_USER")) {
            user_ = user;
        }
        if (const char* password = std::getenv("RABBITMQ_PASSWORD")) {
            password_ = password;
        }
        if (const char* vhost = std::getenv("RABBITMQ_VHOST")) {
            vhost_ = vhost;
        }
        if (const char* queue = std::getenv("RABBITMQ_QUEUE")) {
            queue_ = queue;
        }
        if (const char* dlq = std::getenv("RABBITMQ_DEAD_LETTER_QUEUE")) {
            deadLetterQueue_ = dlq;
        }
        if (const char* prefetch = std::getenv("RABBITMQ_PREFETCH")) {
            prefetch_ = static_cast<uint16_t>(std::stoi(prefetch));
        }
        if (const char* timeout = std::getenv("RABBITMQ_CONFIRM_TIMEOUT_MS")) {
            confirmTimeoutMs_ = std::stoi(timeout);
        }
        if (const char* uri = std::getenv("RABBITMQ_URI")) {
            uri_ = uri;
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getVHost() const { return vhost_; }
    std::string getQueue() const { return queue_; }
    std::string getDeadLetterQueue() const { return deadLetterQueue_; }
    uint16_t getPrefetch() const { return prefetch_; }
    int getConfirmTimeoutMs() const { return confirmTimeoutMs_; }

    std::string getAddress() const {
        if (!uri_.empty()) {
            return uri_;
        }
        return "amqp://" + user_ + ":" + password_ + "@" + host_ + ":" + std::to_string(port_) + vhost_;
    }

private:
    std::string host_ = "rabbitmq";
    int port_ = 5672;
    std::string user_ = "guest";
    std::string password_ = "guest";
    std::string vhost_ = "/";
    std::string queue_ = "transaction_queue";
    std::string deadLetterQueue_ = "transaction_queue.dead";
    uint16_t prefetch_ = 1;
    int confirmTimeoutMs_ = 5000;
    std::string uri_;
};

} // namespace banking::settings
