#pragma once

#include "ports/output/IBalanceStore.hpp"
#include "settings/DbSettings.hpp"
#include "PostgresErrors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace banking::adapters::secondary {

/**
 * @brief Одна транзакция PostgreSQL на соединении хранилища
 *
 * Блокировки строк берутся через SELECT ... FOR UPDATE и держатся до
 * commit() или до деструктора (pqxx::work без commit делает ROLLBACK).
 * Ожидание блокировки ограничено SET LOCAL lock_timeout.
 * Пока транзакция жива, она владеет соединением (connectionLock_).
 */
class PostgresBalanceTransaction : public ports::output::IBalanceTransaction {
public:
    PostgresBalanceTransaction(pqxx::connection& connection,
                               std::unique_lock<std::mutex> connectionLock,
                               int lockTimeoutMs)
        : connectionLock_(std::move(connectionLock))
    {
        withStoreErrors("begin", [&] {
            txn_ = std::make_unique<pqxx::work>(connection);
            txn_->exec("SET LOCAL lock_timeout = " + std::to_string(lockTimeoutMs));
        });
    }

    ~PostgresBalanceTransaction() override {
        if (txn_ && !committed_) {
            std::cout << "[PostgresBalanceStore] Rolling back" << std::endl;
        }
        // ROLLBACK уходит до того, как соединение освободится для следующей транзакции
        txn_.reset();
    }

    std::optional<domain::Money> lockBalance(const std::string& accountId) override {
        return withStoreErrors("lockBalance", [&]() -> std::optional<domain::Money> {
            auto result = txn_->exec_params(
                "SELECT balance_minor FROM accounts WHERE account_id = $1 FOR UPDATE",
                accountId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return domain::Money::fromMinorUnits(result[0][0].as<int64_t>());
        });
    }

    void updateBalance(const std::string& accountId, const domain::Money& balance) override {
        withStoreErrors("updateBalance", [&] {
            auto result = txn_->exec_params(
                "UPDATE accounts SET balance_minor = $2, updated_at = NOW() WHERE account_id = $1",
                accountId,
                balance.minorUnits()
            );
            if (result.affected_rows() != 1) {
                throw std::logic_error("updateBalance: account row vanished: " + accountId);
            }
        });
    }

    void appendLedgerEntry(const domain::LedgerEntry& entry) override {
        withStoreErrors("appendLedgerEntry", [&] {
            std::optional<std::string> fromAccountId;
            std::optional<std::string> toAccountId;
            if (!entry.fromAccountId.empty()) fromAccountId = entry.fromAccountId;
            if (!entry.toAccountId.empty()) toAccountId = entry.toAccountId;

            txn_->exec_params(
                "INSERT INTO ledger_entries (id, account_id, from_account_id, to_account_id, type, "
                "amount_minor, current_balance_minor, created_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, to_timestamp($8::double precision / 1000))",
                entry.id,
                entry.accountId,
                fromAccountId,
                toAccountId,
                domain::toString(entry.kind),
                entry.amount.minorUnits(),
                entry.resultingBalance.minorUnits(),
                entry.createdAt.toMillis()
            );
        });
    }

    void commit() override {
        withStoreErrors("commit", [&] {
            txn_->commit();
        });
        committed_ = true;
    }

private:
    std::unique_lock<std::mutex> connectionLock_;
    std::unique_ptr<pqxx::work> txn_;
    bool committed_ = false;
};

/**
 * @brief PostgreSQL хранилище балансов и ledger
 *
 * Держит одно соединение на всё время жизни процессора. Транзакции на нём
 * идут строго по очереди (mutex_), разорванное соединение открывается
 * заново при следующем begin(). Несколько процессов работают независимо,
 * сериализацию по счёту обеспечивают блокировки строк в PostgreSQL.
 */
class PostgresBalanceStore : public ports::output::IBalanceStore {
public:
    explicit PostgresBalanceStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresBalanceStore] Created, lock_timeout="
                  << settings_->getLockTimeoutMs() << "ms" << std::endl;
    }

    ~PostgresBalanceStore() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::unique_ptr<ports::output::IBalanceTransaction> begin() override {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!connection_ || !connection_->is_open()) {
            withStoreErrors("connect", [&] {
                connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            });
            std::cout << "[PostgresBalanceStore] Connected to " << settings_->getName() << std::endl;
        }

        return std::make_unique<PostgresBalanceTransaction>(
            *connection_, std::move(lock), settings_->getLockTimeoutMs());
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;
};

} // namespace banking::adapters::secondary
