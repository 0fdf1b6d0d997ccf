#pragma once

#include "domain/Money.hpp"
#include "domain/LedgerEntry.hpp"
#include <memory>
#include <optional>
#include <string>

namespace banking::ports::output {

/**
 * @brief Scoped-транзакция над реляционным хранилищем
 *
 * Всё, что сделано через транзакцию, фиксируется только commit().
 * Деструктор без commit() откатывает изменения и снимает блокировки строк,
 * поэтому любой выход по исключению или по бизнес-ошибке безопасен.
 *
 * Все методы могут бросить domain::StoreUnavailableError
 * (потеря соединения, lock_timeout, deadlock).
 *
 * @example
 * ```cpp
 * auto tx = store->begin();
 * auto balance = tx->lockBalance("acc-1");      // SELECT ... FOR UPDATE
 * if (!balance) return notFound();               // rollback в деструкторе
 * tx->updateBalance("acc-1", *balance + amount);
 * tx->appendLedgerEntry(entry);
 * tx->commit();
 * ```
 */
class IBalanceTransaction {
public:
    virtual ~IBalanceTransaction() = default;

    /**
     * @brief Захватить блокировку строки счёта и прочитать баланс
     * @return std::nullopt если счёт не существует
     */
    virtual std::optional<domain::Money> lockBalance(const std::string& accountId) = 0;

    /**
     * @brief Записать новый баланс (строка должна быть заблокирована)
     */
    virtual void updateBalance(const std::string& accountId, const domain::Money& balance) = 0;

    /**
     * @brief Добавить запись в ledger в рамках этой же транзакции
     */
    virtual void appendLedgerEntry(const domain::LedgerEntry& entry) = 0;

    virtual void commit() = 0;
};

/**
 * @brief Реляционное хранилище балансов и ledger
 */
class IBalanceStore {
public:
    virtual ~IBalanceStore() = default;

    /// @throws domain::StoreUnavailableError
    virtual std::unique_ptr<IBalanceTransaction> begin() = 0;
};

} // namespace banking::ports::output
