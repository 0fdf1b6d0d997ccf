#pragma once

#include "domain/Errors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <string>
#include <iostream>

namespace banking::adapters::secondary {

/**
 * @brief Перевод исключений libpqxx в доменные ошибки
 *
 * Временные сбои (потеря соединения, lock_timeout, statement_timeout,
 * deadlock, serialization failure, неизвестный исход commit) становятся
 * domain::StoreUnavailableError, чтобы их можно было повторить.
 * Нарушение уникальности становится domain::AlreadyExistsError.
 * Остальное пробрасывается как есть.
 *
 * @example
 * ```cpp
 * return withStoreErrors("findById", [&] {
 *     pqxx::connection conn(settings_->getConnectionString());
 *     ...
 * });
 * ```
 */
template <typename Fn>
auto withStoreErrors(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const pqxx::broken_connection& e) {
        std::cerr << "[Postgres] " << operation << ": connection lost: " << e.what() << std::endl;
        throw domain::StoreUnavailableError(std::string(operation) + ": connection lost");
    } catch (const pqxx::in_doubt_error& e) {
        std::cerr << "[Postgres] " << operation << ": commit outcome unknown: " << e.what() << std::endl;
        throw domain::StoreUnavailableError(std::string(operation) + ": commit outcome unknown");
    } catch (const pqxx::transaction_rollback& e) {
        // 40001 serialization_failure, 40P01 deadlock_detected
        std::cerr << "[Postgres] " << operation << ": rolled back (" << e.sqlstate() << ")" << std::endl;
        throw domain::StoreUnavailableError(std::string(operation) + ": transaction rolled back by server");
    } catch (const pqxx::unique_violation& e) {
        std::cerr << "[Postgres] " << operation << ": unique violation: " << e.what() << std::endl;
        throw domain::AlreadyExistsError(std::string(operation) + ": duplicate key");
    } catch (const pqxx::sql_error& e) {
        const std::string state = e.sqlstate();
        // 55P03 lock_not_available (lock_timeout), 57014 query_canceled (statement_timeout)
        if (state == "55P03" || state == "57014") {
            std::cerr << "[Postgres] " << operation << ": lock wait timed out (" << state << ")" << std::endl;
            throw domain::StoreUnavailableError(std::string(operation) + ": lock wait timed out");
        }
        std::cerr << "[Postgres] " << operation << " error (" << state << "): " << e.what() << std::endl;
        throw;
    }
}

/**
 * @brief Создать таблицы, если их нет
 *
 * accounts и ledger_entries живут в одной базе, поэтому баланс и запись
 * журнала фиксируются одной транзакцией. Вызывается один раз при старте
 * (BankingApp::configureInjection), до создания репозиториев.
 */
inline void initSchema(const settings::DbSettings& settings) {
    pqxx::connection conn(settings.getConnectionString());
    pqxx::work txn(conn);

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS accounts (
            account_id VARCHAR(64) PRIMARY KEY,
            username VARCHAR(255) NOT NULL,
            phone VARCHAR(32) NOT NULL UNIQUE,
            balance_minor BIGINT NOT NULL DEFAULT 0 CHECK (balance_minor >= 0),
            created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
            updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
        )
    )");

    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS ledger_entries (
            id VARCHAR(64) PRIMARY KEY,
            seq BIGSERIAL NOT NULL,
            account_id VARCHAR(64) NOT NULL REFERENCES accounts(account_id),
            from_account_id VARCHAR(64),
            to_account_id VARCHAR(64),
            type VARCHAR(16) NOT NULL,
            amount_minor BIGINT NOT NULL CHECK (amount_minor > 0),
            current_balance_minor BIGINT NOT NULL CHECK (current_balance_minor >= 0),
            created_at TIMESTAMPTZ NOT NULL
        )
    )");

    txn.exec(R"(
        CREATE INDEX IF NOT EXISTS idx_ledger_entries_account_created
            ON ledger_entries (account_id, created_at)
    )");

    txn.commit();
    std::cout << "[Postgres] Schema initialized" << std::endl;
}

} // namespace banking::adapters::secondary
