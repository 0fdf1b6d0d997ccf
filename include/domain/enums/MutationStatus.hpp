#pragma once

#include <string>

namespace banking::domain {

enum class MutationStatus {
    APPLIED,
    ACCOUNT_NOT_FOUND,
    INSUFFICIENT_BALANCE,
    BALANCE_OVERFLOW,     ///< Новый баланс не помещается в int64
    STORE_UNAVAILABLE
};

inline std::string toString(MutationStatus status) {
    switch (status) {
        case MutationStatus::APPLIED: return "APPLIED";
        case MutationStatus::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case MutationStatus::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case MutationStatus::BALANCE_OVERFLOW: return "BALANCE_OVERFLOW";
        case MutationStatus::STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

} // namespace banking::domain
