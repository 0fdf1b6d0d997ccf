#pragma once

#include "domain/Instruction.hpp"
#include "domain/MutationResult.hpp"

namespace banking::ports::input {

/**
 * @brief Применение одной инструкции к балансам и ledger как атомарной единицы
 */
class IBalanceMutator {
public:
    virtual ~IBalanceMutator() = default;

    virtual domain::MutationResult apply(const domain::Instruction& instruction) = 0;
};

} // namespace banking::ports::input
