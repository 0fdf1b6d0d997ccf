#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace banking::domain {

/**
 * @brief Банковский счёт
 *
 * Создаётся один раз при открытии, баланс меняет только BalanceMutator.
 */
struct Account {
    std::string accountId;
    std::string username;
    std::string phone;
    Money balance;
    Timestamp createdAt;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["account_id"] = accountId;
        j["username"] = username;
        j["phone"] = phone;
        j["balance"] = balance.toDouble();
        j["created_at"] = createdAt.toString();
        return j;
    }
};

} // namespace banking::domain
