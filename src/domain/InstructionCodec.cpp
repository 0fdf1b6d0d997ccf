#include "domain/InstructionCodec.hpp"
#include "domain/Errors.hpp"

namespace banking::domain {

namespace {

std::string optionalString(const nlohmann::json& json, const char* field) {
    if (!json.contains(field) || json[field].is_null()) {
        return "";
    }
    if (!json[field].is_string()) {
        throw ValidationError(std::string(field) + " must be a string");
    }
    return json[field].get<std::string>();
}

} // namespace

nlohmann::json InstructionCodec::toJson(const Instruction& instruction) {
    nlohmann::json j;
    if (instruction.kind() == InstructionKind::TRANSFER) {
        j["from_account_id"] = instruction.fromAccountId();
        j["to_account_id"] = instruction.toAccountId();
    } else {
        j["account_id"] = instruction.accountId();
    }
    j["type"] = toString(instruction.kind());
    j["amount"] = instruction.amount().toDouble();
    return j;
}

std::string InstructionCodec::encode(const Instruction& instruction) {
    return toJson(instruction).dump();
}

Instruction InstructionCodec::fromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ValidationError("instruction must be a JSON object");
    }

    if (!json.contains("type") || !json["type"].is_string()) {
        throw ValidationError("type is required");
    }
    auto kind = parseInstructionKind(json["type"].get<std::string>());
    if (!kind) {
        throw ValidationError("invalid transaction type: " + json["type"].get<std::string>());
    }

    if (!json.contains("amount") || !json["amount"].is_number()) {
        throw ValidationError("amount must be a number");
    }
    auto amount = Money::fromDouble(json["amount"].get<double>());

    switch (*kind) {
        case InstructionKind::DEPOSIT:
            return Instruction::deposit(optionalString(json, "account_id"), amount);
        case InstructionKind::WITHDRAWAL:
            return Instruction::withdrawal(optionalString(json, "account_id"), amount);
        case InstructionKind::TRANSFER:
            return Instruction::transfer(optionalString(json, "from_account_id"),
                                         optionalString(json, "to_account_id"),
                                         amount);
    }
    throw ValidationError("invalid transaction type");
}

Instruction InstructionCodec::decode(const std::string& payload) {
    try {
        return fromJson(nlohmann::json::parse(payload));
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(std::string("malformed payload: ") + e.what());
    } catch (const ValidationError& e) {
        throw DecodeError(std::string("invalid instruction: ") + e.what());
    }
}

} // namespace banking::domain
