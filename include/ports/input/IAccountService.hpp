#pragma once

#include "domain/Account.hpp"
#include <optional>
#include <string>
#include <vector>

namespace banking::ports::input {

struct CreateAccountRequest {
    std::string username;
    std::string phone;
};

class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Открыть счёт с нулевым балансом
     * @throws domain::ValidationError некорректные username/phone
     * @throws domain::AlreadyExistsError телефон уже зарегистрирован
     */
    virtual domain::Account createAccount(const CreateAccountRequest& request) = 0;

    virtual std::vector<domain::Account> getAccounts() = 0;

    virtual std::optional<domain::Account> getAccountById(const std::string& accountId) = 0;
};

} // namespace banking::ports::input
