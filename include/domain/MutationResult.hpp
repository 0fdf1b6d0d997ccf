#pragma once

#include "LedgerEntry.hpp"
#include "enums/MutationStatus.hpp"
#include <string>
#include <vector>

namespace banking::domain {

/**
 * @brief Результат применения инструкции к балансам
 *
 * Делит исходы на два класса:
 * - terminal: APPLIED, ACCOUNT_NOT_FOUND, INSUFFICIENT_BALANCE, BALANCE_OVERFLOW;
 *   повтор не изменит результат, сообщение подтверждается (ack)
 * - retryable: STORE_UNAVAILABLE, сообщение возвращается в очередь
 */
class MutationResult {
public:
    MutationStatus status = MutationStatus::APPLIED;
    std::string message;
    std::vector<LedgerEntry> entries;   ///< Записанные в ledger (только APPLIED)

    static MutationResult applied(std::vector<LedgerEntry> entries) {
        MutationResult r;
        r.status = MutationStatus::APPLIED;
        r.message = "Transaction applied";
        r.entries = std::move(entries);
        return r;
    }

    static MutationResult failed(MutationStatus status, std::string message) {
        MutationResult r;
        r.status = status;
        r.message = std::move(message);
        return r;
    }

    bool isApplied() const { return status == MutationStatus::APPLIED; }
    bool isRetryable() const { return status == MutationStatus::STORE_UNAVAILABLE; }
    bool isTerminal() const { return !isRetryable(); }
};

} // namespace banking::domain
