#pragma once

#include "domain/Instruction.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/SubmitResult.hpp"
#include <string>
#include <vector>

namespace banking::ports::input {

class ITransactionService {
public:
    virtual ~ITransactionService() = default;

    /**
     * @brief Предварительно проверить и опубликовать инструкцию в очередь
     *
     * Применение произойдёт асинхронно в TransactionProcessor.
     */
    virtual domain::SubmitResult submit(const domain::Instruction& instruction) = 0;

    /**
     * @brief История операций счёта (от старых к новым)
     */
    virtual std::vector<domain::LedgerEntry> getHistory(const std::string& accountId) = 0;
};

} // namespace banking::ports::input
