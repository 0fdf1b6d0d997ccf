#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "settings/DbSettings.hpp"
#include "PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace banking::adapters::secondary {

/**
 * @brief Чтение журнала операций из ledger_entries
 */
class PostgresLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit PostgresLedgerRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresLedgerRepository] Created" << std::endl;
    }

    std::vector<domain::LedgerEntry> findByAccountId(const std::string& accountId) override {
        return withStoreErrors("PostgresLedgerRepository::findByAccountId", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // seq задаёт порядок вставки при совпадающих created_at
            auto result = txn.exec_params(
                "SELECT id, account_id, from_account_id, to_account_id, type, amount_minor, "
                "current_balance_minor, (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms "
                "FROM ledger_entries WHERE account_id = $1 "
                "ORDER BY created_at ASC, seq ASC",
                accountId
            );

            std::vector<domain::LedgerEntry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.push_back(rowToEntry(row));
            }
            return entries;
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static domain::LedgerEntry rowToEntry(const pqxx::row& row) {
        auto kind = domain::parseInstructionKind(row["type"].as<std::string>());
        if (!kind) {
            throw std::runtime_error("Unknown ledger entry type: " + row["type"].as<std::string>());
        }

        domain::LedgerEntry entry;
        entry.id = row["id"].as<std::string>();
        entry.accountId = row["account_id"].as<std::string>();
        entry.fromAccountId = row["from_account_id"].is_null() ? "" : row["from_account_id"].as<std::string>();
        entry.toAccountId = row["to_account_id"].is_null() ? "" : row["to_account_id"].as<std::string>();
        entry.kind = *kind;
        entry.amount = domain::Money::fromMinorUnits(row["amount_minor"].as<int64_t>());
        entry.resultingBalance = domain::Money::fromMinorUnits(row["current_balance_minor"].as<int64_t>());
        entry.createdAt = domain::Timestamp::fromMillis(row["created_ms"].as<int64_t>());
        return entry;
    }
};

} // namespace banking::adapters::secondary
