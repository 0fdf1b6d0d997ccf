#include "domain/Instruction.hpp"
#include "domain/Errors.hpp"
#include <algorithm>

namespace banking::domain {

namespace {

void requirePositive(const Money& amount) {
    if (amount.isZero()) {
        throw ValidationError("amount must be greater than 0");
    }
}

void requireAccount(const std::string& accountId, const char* field) {
    if (accountId.empty()) {
        throw ValidationError(std::string(field) + " is required");
    }
}

} // namespace

Instruction::Instruction(InstructionKind kind,
                         std::string accountId,
                         std::string fromAccountId,
                         std::string toAccountId,
                         Money amount)
    : kind_(kind)
    , accountId_(std::move(accountId))
    , fromAccountId_(std::move(fromAccountId))
    , toAccountId_(std::move(toAccountId))
    , amount_(amount)
{
}

Instruction Instruction::deposit(const std::string& accountId, const Money& amount) {
    requireAccount(accountId, "account_id");
    requirePositive(amount);
    return Instruction(InstructionKind::DEPOSIT, accountId, "", "", amount);
}

Instruction Instruction::withdrawal(const std::string& accountId, const Money& amount) {
    requireAccount(accountId, "account_id");
    requirePositive(amount);
    return Instruction(InstructionKind::WITHDRAWAL, accountId, "", "", amount);
}

Instruction Instruction::transfer(const std::string& fromAccountId,
                                  const std::string& toAccountId,
                                  const Money& amount) {
    requireAccount(fromAccountId, "from_account_id");
    requireAccount(toAccountId, "to_account_id");
    if (fromAccountId == toAccountId) {
        throw ValidationError("from_account_id and to_account_id must differ");
    }
    requirePositive(amount);
    return Instruction(InstructionKind::TRANSFER, "", fromAccountId, toAccountId, amount);
}

std::vector<std::string> Instruction::affectedAccounts() const {
    if (kind_ != InstructionKind::TRANSFER) {
        return {accountId_};
    }
    std::vector<std::string> accounts{fromAccountId_, toAccountId_};
    std::sort(accounts.begin(), accounts.end());
    return accounts;
}

std::string Instruction::describe() const {
    std::string text = toString(kind_) + " " + amount_.toString() + " ";
    if (kind_ == InstructionKind::TRANSFER) {
        return text + fromAccountId_ + " -> " + toAccountId_;
    }
    return text + accountId_;
}

bool Instruction::operator==(const Instruction& other) const {
    return kind_ == other.kind_
        && accountId_ == other.accountId_
        && fromAccountId_ == other.fromAccountId_
        && toAccountId_ == other.toAccountId_
        && amount_ == other.amount_;
}

} // namespace banking::domain
