#pragma once

#include <cstdlib>
#include <cstdint>
#include <string>

namespace banking::settings {

/**
 * @brief Настройки TransactionProcessor
 *
 * Читает из ENV:
 * - PROCESSOR_MAX_DELIVERY_ATTEMPTS (default: 5, 0 = повторять бесконечно)
 * - PROCESSOR_ENABLED (default: "true")
 *
 * После исчерпания попыток сообщение уходит в dead-letter очередь.
 */
class ProcessorSettings {
public:
    ProcessorSettings() {
        if (const char* val = std::getenv("PROCESSOR_MAX_DELIVERY_ATTEMPTS")) {
            maxDeliveryAttempts_ = static_cast<uint32_t>(std::stoul(val));
        }
        if (const char* val = std::getenv("PROCESSOR_ENABLED")) {
            enabled_ = std::string(val) == "true";
        }
    }

    uint32_t getMaxDeliveryAttempts() const { return maxDeliveryAttempts_; }
    bool isEnabled() const { return enabled_; }
    bool isRetryBounded() const { return maxDeliveryAttempts_ > 0; }

    // Для тестов
    void setMaxDeliveryAttempts(uint32_t attempts) { maxDeliveryAttempts_ = attempts; }

private:
    uint32_t maxDeliveryAttempts_ = 5;
    bool enabled_ = true;
};

} // namespace banking::settings
