#pragma once

#include "domain/LedgerEntry.hpp"
#include <string>
#include <vector>

namespace banking::ports::output {

/**
 * @brief Чтение журнала операций
 *
 * Запись идёт только через IBalanceTransaction::appendLedgerEntry.
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief История счёта, от старых записей к новым
     */
    virtual std::vector<domain::LedgerEntry> findByAccountId(const std::string& accountId) = 0;
};

} // namespace banking::ports::output
