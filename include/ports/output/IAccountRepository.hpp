#pragma once

#include "domain/Account.hpp"
#include <optional>
#include <string>
#include <vector>

namespace banking::ports::output {

/**
 * @brief Справочник счетов
 *
 * Баланс здесь только читается; меняет его BalanceMutator через IBalanceStore.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Открыть счёт
     * @throws domain::AlreadyExistsError если телефон или accountId заняты
     */
    virtual domain::Account save(const domain::Account& account) = 0;

    virtual std::optional<domain::Account> findById(const std::string& accountId) = 0;

    virtual std::vector<domain::Account> findAll() = 0;
};

} // namespace banking::ports::output
