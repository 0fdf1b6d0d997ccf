#pragma once

#include "Money.hpp"
#include "enums/InstructionKind.hpp"
#include <string>
#include <vector>

namespace banking::domain {

/**
 * @brief Неизменяемая инструкция на изменение баланса
 *
 * Создаётся только фабриками, которые проверяют форму:
 * - deposit / withdrawal: нужен accountId
 * - transfer: нужны fromAccountId и toAccountId, и они различны
 * - amount > 0 для всех видов
 *
 * Идентичности нет: две инструкции с одинаковым содержимым равны.
 */
class Instruction {
public:
    /// @throws ValidationError
    static Instruction deposit(const std::string& accountId, const Money& amount);

    /// @throws ValidationError
    static Instruction withdrawal(const std::string& accountId, const Money& amount);

    /// @throws ValidationError
    static Instruction transfer(const std::string& fromAccountId,
                                const std::string& toAccountId,
                                const Money& amount);

    InstructionKind kind() const { return kind_; }
    const std::string& accountId() const { return accountId_; }
    const std::string& fromAccountId() const { return fromAccountId_; }
    const std::string& toAccountId() const { return toAccountId_; }
    const Money& amount() const { return amount_; }

    /**
     * @brief Счета, которые затрагивает инструкция
     *
     * Для transfer: в порядке возрастания accountId (порядок захвата блокировок).
     */
    std::vector<std::string> affectedAccounts() const;

    /// Для логов: "transfer 100.00 acc-a -> acc-b"
    std::string describe() const;

    bool operator==(const Instruction& other) const;

private:
    Instruction(InstructionKind kind,
                std::string accountId,
                std::string fromAccountId,
                std::string toAccountId,
                Money amount);

    InstructionKind kind_;
    std::string accountId_;
    std::string fromAccountId_;
    std::string toAccountId_;
    Money amount_;
};

} // namespace banking::domain
