#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/InstructionKind.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace banking::domain {

/**
 * @brief Запись журнала операций
 *
 * Одна запись на каждый затронутый счёт: transfer порождает две записи,
 * каждая со своим результирующим балансом. После записи не изменяется
 * и не удаляется.
 *
 * Таблица: ledger_entries
 * - id VARCHAR(64) PRIMARY KEY
 * - account_id VARCHAR(64) NOT NULL
 * - from_account_id / to_account_id VARCHAR(64) NULL (только transfer)
 * - type VARCHAR(16) NOT NULL
 * - amount_minor BIGINT NOT NULL (в копейках)
 * - current_balance_minor BIGINT NOT NULL (в копейках)
 * - created_at TIMESTAMPTZ NOT NULL
 */
struct LedgerEntry {
    std::string id;
    std::string accountId;
    std::string fromAccountId;     ///< Пусто, если не transfer
    std::string toAccountId;       ///< Пусто, если не transfer
    InstructionKind kind = InstructionKind::DEPOSIT;
    Money amount;
    Timestamp createdAt;
    Money resultingBalance;        ///< Баланс accountId после операции

    /**
     * @brief Знаковый вклад записи в баланс accountId
     *
     * Плюс для deposit и входящего transfer, минус для withdrawal и исходящего transfer.
     */
    int64_t signedMinorUnits() const {
        bool outgoing = kind == InstructionKind::WITHDRAWAL
            || (kind == InstructionKind::TRANSFER && fromAccountId == accountId);
        return outgoing ? -amount.minorUnits() : amount.minorUnits();
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["id"] = id;
        j["account_id"] = accountId;
        if (!fromAccountId.empty()) j["from_account_id"] = fromAccountId;
        if (!toAccountId.empty()) j["to_account_id"] = toAccountId;
        j["type"] = toString(kind);
        j["amount"] = amount.toDouble();
        j["created_at"] = createdAt.toString();
        j["current_balance"] = resultingBalance.toDouble();
        return j;
    }
};

} // namespace banking::domain
