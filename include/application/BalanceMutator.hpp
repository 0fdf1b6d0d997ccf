#pragma once

#include "ports/input/IBalanceMutator.hpp"
#include "ports/output/IBalanceStore.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <map>
#include <memory>
#include <stdexcept>
#include <iostream>

namespace banking::application {

/**
 * @brief Применяет инструкцию к балансам и ledger одной транзакцией
 *
 * Единственное место, где обеспечивается сохранение денег:
 * - баланс читается под блокировкой строки (SELECT ... FOR UPDATE)
 * - withdrawal/transfer не проходят, если средств меньше amount
 * - новые балансы и записи ledger фиксируются одним commit()
 * - любой выход без commit() откатывает транзакцию (RAII в IBalanceTransaction)
 *
 * Transfer блокирует обе строки в порядке возрастания accountId,
 * поэтому встречные переводы A→B и B→A не образуют deadlock.
 */
class BalanceMutator : public ports::input::IBalanceMutator {
public:
    explicit BalanceMutator(std::shared_ptr<ports::output::IBalanceStore> store)
        : store_(std::move(store))
    {
        std::cout << "[BalanceMutator] Created" << std::endl;
    }

    domain::MutationResult apply(const domain::Instruction& instruction) override {
        try {
            auto tx = store_->begin();

            switch (instruction.kind()) {
                case domain::InstructionKind::DEPOSIT:
                    return applyDeposit(*tx, instruction);
                case domain::InstructionKind::WITHDRAWAL:
                    return applyWithdrawal(*tx, instruction);
                case domain::InstructionKind::TRANSFER:
                    return applyTransfer(*tx, instruction);
            }
            throw std::logic_error("unknown instruction kind");

        } catch (const std::overflow_error& e) {
            // Транзакция откатывается в деструкторе, повтор даст тот же результат
            std::cerr << "[BalanceMutator] REJECTED: balance overflow for " << instruction.describe()
                      << ": " << e.what() << std::endl;
            return domain::MutationResult::failed(domain::MutationStatus::BALANCE_OVERFLOW, e.what());
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[BalanceMutator] Store unavailable for " << instruction.describe()
                      << ": " << e.what() << std::endl;
            return domain::MutationResult::failed(domain::MutationStatus::STORE_UNAVAILABLE, e.what());
        }
    }

private:
    std::shared_ptr<ports::output::IBalanceStore> store_;

    domain::MutationResult applyDeposit(ports::output::IBalanceTransaction& tx,
                                        const domain::Instruction& instruction) {
        const auto& accountId = instruction.accountId();

        auto balance = tx.lockBalance(accountId);
        if (!balance) {
            return accountNotFound(accountId);
        }

        auto newBalance = *balance + instruction.amount();
        tx.updateBalance(accountId, newBalance);

        auto entry = makeEntry(instruction, accountId, newBalance, domain::Timestamp::now());
        tx.appendLedgerEntry(entry);
        tx.commit();

        std::cout << "[BalanceMutator] Applied " << instruction.describe() << ": "
                  << balance->toString() << " -> " << newBalance.toString() << std::endl;
        return domain::MutationResult::applied({entry});
    }

    domain::MutationResult applyWithdrawal(ports::output::IBalanceTransaction& tx,
                                           const domain::Instruction& instruction) {
        const auto& accountId = instruction.accountId();

        auto balance = tx.lockBalance(accountId);
        if (!balance) {
            return accountNotFound(accountId);
        }
        if (*balance < instruction.amount()) {
            return insufficientBalance(accountId, *balance, instruction);
        }

        auto newBalance = *balance - instruction.amount();
        tx.updateBalance(accountId, newBalance);

        auto entry = makeEntry(instruction, accountId, newBalance, domain::Timestamp::now());
        tx.appendLedgerEntry(entry);
        tx.commit();

        std::cout << "[BalanceMutator] Applied " << instruction.describe() << ": "
                  << balance->toString() << " -> " << newBalance.toString() << std::endl;
        return domain::MutationResult::applied({entry});
    }

    domain::MutationResult applyTransfer(ports::output::IBalanceTransaction& tx,
                                         const domain::Instruction& instruction) {
        const auto& fromId = instruction.fromAccountId();
        const auto& toId = instruction.toAccountId();

        // Фиксированный порядок захвата блокировок
        std::map<std::string, domain::Money> locked;
        for (const auto& accountId : instruction.affectedAccounts()) {
            auto balance = tx.lockBalance(accountId);
            if (!balance) {
                return accountNotFound(accountId);
            }
            locked.emplace(accountId, *balance);
        }

        const auto fromBalance = locked.at(fromId);
        const auto toBalance = locked.at(toId);
        if (fromBalance < instruction.amount()) {
            return insufficientBalance(fromId, fromBalance, instruction);
        }

        auto newFromBalance = fromBalance - instruction.amount();
        auto newToBalance = toBalance + instruction.amount();
        tx.updateBalance(fromId, newFromBalance);
        tx.updateBalance(toId, newToBalance);

        auto now = domain::Timestamp::now();
        auto fromEntry = makeEntry(instruction, fromId, newFromBalance, now);
        auto toEntry = makeEntry(instruction, toId, newToBalance, now);
        tx.appendLedgerEntry(fromEntry);
        tx.appendLedgerEntry(toEntry);
        tx.commit();

        std::cout << "[BalanceMutator] Applied " << instruction.describe() << ": "
                  << fromId << "=" << newFromBalance.toString() << ", "
                  << toId << "=" << newToBalance.toString() << std::endl;
        return domain::MutationResult::applied({fromEntry, toEntry});
    }

    static domain::LedgerEntry makeEntry(const domain::Instruction& instruction,
                                         const std::string& accountId,
                                         const domain::Money& resultingBalance,
                                         const domain::Timestamp& createdAt) {
        domain::LedgerEntry entry;
        entry.id = utils::IdGenerator::uuid();
        entry.accountId = accountId;
        entry.fromAccountId = instruction.fromAccountId();
        entry.toAccountId = instruction.toAccountId();
        entry.kind = instruction.kind();
        entry.amount = instruction.amount();
        entry.createdAt = createdAt;
        entry.resultingBalance = resultingBalance;
        return entry;
    }

    static domain::MutationResult accountNotFound(const std::string& accountId) {
        std::cout << "[BalanceMutator] REJECTED: account not found " << accountId << std::endl;
        return domain::MutationResult::failed(
            domain::MutationStatus::ACCOUNT_NOT_FOUND, "Account not found: " + accountId);
    }

    static domain::MutationResult insufficientBalance(const std::string& accountId,
                                                      const domain::Money& balance,
                                                      const domain::Instruction& instruction) {
        std::cout << "[BalanceMutator] REJECTED: insufficient balance " << accountId << " "
                  << balance.toString() << " < " << instruction.amount().toString() << std::endl;
        return domain::MutationResult::failed(
            domain::MutationStatus::INSUFFICIENT_BALANCE,
            "Insufficient balance on " + accountId + ": " + balance.toString()
                + " < " + instruction.amount().toString());
    }
};

} // namespace banking::application
