#pragma once

#include "ports/input/ITransactionService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/IInstructionPublisher.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>

namespace banking::application {

/**
 * @brief Синхронная часть приёма транзакций
 *
 * Перед публикацией проверяет существование счетов и достаточность средств.
 * Проверка предварительная: баланс может измениться до применения,
 * окончательное решение принимает BalanceMutator под блокировкой строки.
 */
class TransactionService : public ports::input::ITransactionService {
public:
    TransactionService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::ILedgerRepository> ledgerRepo,
        std::shared_ptr<ports::output::IInstructionPublisher> publisher)
        : accountRepo_(std::move(accountRepo))
        , ledgerRepo_(std::move(ledgerRepo))
        , publisher_(std::move(publisher))
    {
        std::cout << "[TransactionService] Created" << std::endl;
    }

    domain::SubmitResult submit(const domain::Instruction& instruction) override {
        // Счёт, с которого списываются деньги (пусто для deposit)
        std::string debitAccountId;
        if (instruction.kind() == domain::InstructionKind::WITHDRAWAL) {
            debitAccountId = instruction.accountId();
        } else if (instruction.kind() == domain::InstructionKind::TRANSFER) {
            debitAccountId = instruction.fromAccountId();
        }

        for (const auto& accountId : instruction.affectedAccounts()) {
            auto account = accountRepo_->findById(accountId);
            if (!account) {
                return reject(domain::SubmitStatus::ACCOUNT_NOT_FOUND, "Account not found: " + accountId);
            }
            if (accountId == debitAccountId && account->balance < instruction.amount()) {
                return reject(domain::SubmitStatus::INSUFFICIENT_BALANCE, "Insufficient balance");
            }
        }

        try {
            publisher_->publish(instruction);
        } catch (const domain::PublishError& e) {
            std::cerr << "[TransactionService] Publish failed for " << instruction.describe()
                      << ": " << e.what() << std::endl;
            return reject(domain::SubmitStatus::QUEUE_UNAVAILABLE, "Transaction queue unavailable");
        }

        std::cout << "[TransactionService] Queued " << instruction.describe() << std::endl;

        domain::SubmitResult result;
        result.status = domain::SubmitStatus::ACCEPTED;
        result.message = "Transaction queued successfully";
        return result;
    }

    std::vector<domain::LedgerEntry> getHistory(const std::string& accountId) override {
        return ledgerRepo_->findByAccountId(accountId);
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::ILedgerRepository> ledgerRepo_;
    std::shared_ptr<ports::output::IInstructionPublisher> publisher_;

    static domain::SubmitResult reject(domain::SubmitStatus status, std::string message) {
        std::cout << "[TransactionService] Rejected: " << message << std::endl;
        domain::SubmitResult result;
        result.status = status;
        result.message = std::move(message);
        return result;
    }
};

} // namespace banking::application
