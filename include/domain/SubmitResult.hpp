#pragma once

#include <string>

namespace banking::domain {

enum class SubmitStatus {
    ACCEPTED,
    ACCOUNT_NOT_FOUND,
    INSUFFICIENT_BALANCE,
    QUEUE_UNAVAILABLE
};

inline std::string toString(SubmitStatus status) {
    switch (status) {
        case SubmitStatus::ACCEPTED: return "ACCEPTED";
        case SubmitStatus::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case SubmitStatus::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case SubmitStatus::QUEUE_UNAVAILABLE: return "QUEUE_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Результат постановки инструкции в очередь
 */
struct SubmitResult {
    SubmitStatus status = SubmitStatus::ACCEPTED;
    std::string message;

    bool accepted() const { return status == SubmitStatus::ACCEPTED; }
};

} // namespace banking::domain
