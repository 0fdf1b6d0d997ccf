#pragma once

#include "Instruction.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace banking::domain {

/**
 * @brief Wire-формат инструкции в очереди
 *
 * ```json
 * { "account_id": "acc-1", "type": "deposit", "amount": 50.0 }
 * { "from_account_id": "acc-1", "to_account_id": "acc-2", "type": "transfer", "amount": 100 }
 * ```
 * Поля, не относящиеся к виду инструкции, не сериализуются.
 */
class InstructionCodec {
public:
    static nlohmann::json toJson(const Instruction& instruction);

    static std::string encode(const Instruction& instruction);

    /**
     * @brief Собрать инструкцию из JSON-объекта (тело HTTP-запроса)
     * @throws ValidationError
     */
    static Instruction fromJson(const nlohmann::json& json);

    /**
     * @brief Разобрать тело сообщения из очереди
     * @throws DecodeError если payload не JSON или инструкция некорректна
     */
    static Instruction decode(const std::string& payload);
};

} // namespace banking::domain
