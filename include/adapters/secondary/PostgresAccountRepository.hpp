#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/DbSettings.hpp"
#include "PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace banking::adapters::secondary {

/**
 * @brief PostgreSQL реализация справочника счетов
 *
 * Таблица: accounts
 * - account_id VARCHAR(64) PRIMARY KEY
 * - username VARCHAR(255) NOT NULL
 * - phone VARCHAR(32) NOT NULL UNIQUE
 * - balance_minor BIGINT NOT NULL CHECK (balance_minor >= 0)  (в копейках)
 * - created_at / updated_at TIMESTAMPTZ
 *
 * Баланс только читается; пишет его PostgresBalanceStore.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountRepository] Created for " << settings_->getName() << std::endl;
    }

    domain::Account save(const domain::Account& account) override {
        return withStoreErrors("PostgresAccountRepository::save", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec_params(
                "INSERT INTO accounts (account_id, username, phone, balance_minor, created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, to_timestamp($5::double precision / 1000), NOW())",
                account.accountId,
                account.username,
                account.phone,
                account.balance.minorUnits(),
                account.createdAt.toMillis()
            );

            txn.commit();
            std::cout << "[PostgresAccountRepository] Saved account " << account.accountId << std::endl;
            return account;
        });
    }

    std::optional<domain::Account> findById(const std::string& accountId) override {
        return withStoreErrors("PostgresAccountRepository::findById", [&]() -> std::optional<domain::Account> {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT account_id, username, phone, balance_minor, "
                "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms "
                "FROM accounts WHERE account_id = $1",
                accountId
            );

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToAccount(result[0]);
        });
    }

    std::vector<domain::Account> findAll() override {
        return withStoreErrors("PostgresAccountRepository::findAll", [&] {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec(
                "SELECT account_id, username, phone, balance_minor, "
                "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_ms "
                "FROM accounts ORDER BY created_at, account_id"
            );

            std::vector<domain::Account> accounts;
            accounts.reserve(result.size());
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.accountId = row["account_id"].as<std::string>();
        account.username = row["username"].as<std::string>();
        account.phone = row["phone"].as<std::string>();
        account.balance = domain::Money::fromMinorUnits(row["balance_minor"].as<int64_t>());
        account.createdAt = domain::Timestamp::fromMillis(row["created_ms"].as<int64_t>());
        return account;
    }
};

} // namespace banking::adapters::secondary
