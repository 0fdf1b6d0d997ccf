#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <cctype>
#include <memory>
#include <optional>
#include <iostream>

namespace banking::application {

/**
 * @brief Открытие и чтение счетов
 *
 * Счёт открывается с нулевым балансом; ID вида acc-{16 hex}.
 */
class AccountService : public ports::input::IAccountService {
public:
    static constexpr size_t MIN_USERNAME_LENGTH = 4;
    static constexpr size_t PHONE_DIGITS = 10;

    explicit AccountService(std::shared_ptr<ports::output::IAccountRepository> accountRepo)
        : accountRepo_(std::move(accountRepo))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::Account createAccount(const ports::input::CreateAccountRequest& request) override {
        if (request.username.size() < MIN_USERNAME_LENGTH) {
            throw domain::ValidationError("Username must be at least 4 characters long");
        }

        auto phone = normalizePhone(request.phone);
        if (!phone) {
            throw domain::ValidationError("Phone number must contain exactly 10 digits");
        }

        domain::Account account;
        account.accountId = utils::IdGenerator::withPrefix("acc");
        account.username = request.username;
        account.phone = *phone;
        account.balance = domain::Money::zero();
        account.createdAt = domain::Timestamp::now();

        std::cout << "[AccountService] Creating account: " << account.accountId
                  << " username=" << account.username << std::endl;

        return accountRepo_->save(account);
    }

    std::vector<domain::Account> getAccounts() override {
        return accountRepo_->findAll();
    }

    std::optional<domain::Account> getAccountById(const std::string& accountId) override {
        return accountRepo_->findById(accountId);
    }

    /**
     * @brief Убрать '-' и пробелы; допустимо ровно 10 цифр
     */
    static std::optional<std::string> normalizePhone(const std::string& phone) {
        std::string digits;
        for (char c : phone) {
            if (c == '-' || c == ' ') continue;
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            digits.push_back(c);
        }
        if (digits.size() != PHONE_DIGITS) {
            return std::nullopt;
        }
        return digits;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
};

} // namespace banking::application
