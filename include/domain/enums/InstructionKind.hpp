#pragma once

#include <string>
#include <optional>

namespace banking::domain {

enum class InstructionKind {
    DEPOSIT,
    WITHDRAWAL,
    TRANSFER
};

/// Значение поля "type" в wire-формате и в ledger
inline std::string toString(InstructionKind kind) {
    switch (kind) {
        case InstructionKind::DEPOSIT: return "deposit";
        case InstructionKind::WITHDRAWAL: return "withdrawal";
        case InstructionKind::TRANSFER: return "transfer";
        default: return "unknown";
    }
}

inline std::optional<InstructionKind> parseInstructionKind(const std::string& str) {
    if (str == "deposit") return InstructionKind::DEPOSIT;
    if (str == "withdrawal") return InstructionKind::WITHDRAWAL;
    if (str == "transfer") return InstructionKind::TRANSFER;
    return std::nullopt;
}

} // namespace banking::domain
