#include <gtest/gtest.h>

#include "domain/Instruction.hpp"
#include "domain/Errors.hpp"

using namespace banking::domain;

namespace {

Money amount(int64_t minor) { return Money::fromMinorUnits(minor); }

} // namespace

TEST(InstructionTest, Deposit_Valid) {
    auto instruction = Instruction::deposit("acc-1", amount(5000));

    EXPECT_EQ(instruction.kind(), InstructionKind::DEPOSIT);
    EXPECT_EQ(instruction.accountId(), "acc-1");
    EXPECT_TRUE(instruction.fromAccountId().empty());
    EXPECT_EQ(instruction.amount().minorUnits(), 5000);
}

TEST(InstructionTest, Withdrawal_RequiresAccountId) {
    EXPECT_THROW(Instruction::withdrawal("", amount(100)), ValidationError);
}

TEST(InstructionTest, ZeroAmountRejectedForAllKinds) {
    EXPECT_THROW(Instruction::deposit("acc-1", Money::zero()), ValidationError);
    EXPECT_THROW(Instruction::withdrawal("acc-1", Money::zero()), ValidationError);
    EXPECT_THROW(Instruction::transfer("acc-1", "acc-2", Money::zero()), ValidationError);
}

TEST(InstructionTest, Transfer_RequiresBothSides) {
    EXPECT_THROW(Instruction::transfer("", "acc-2", amount(100)), ValidationError);
    EXPECT_THROW(Instruction::transfer("acc-1", "", amount(100)), ValidationError);
}

TEST(InstructionTest, Transfer_SameAccountRejected) {
    EXPECT_THROW(Instruction::transfer("acc-1", "acc-1", amount(100)), ValidationError);
}

TEST(InstructionTest, Transfer_AffectedAccountsInLockOrder) {
    auto forward = Instruction::transfer("acc-b", "acc-a", amount(100));
    auto backward = Instruction::transfer("acc-a", "acc-b", amount(100));

    std::vector<std::string> expected{"acc-a", "acc-b"};
    EXPECT_EQ(forward.affectedAccounts(), expected);
    EXPECT_EQ(backward.affectedAccounts(), expected);
}

TEST(InstructionTest, Deposit_AffectsSingleAccount) {
    auto instruction = Instruction::deposit("acc-1", amount(100));
    EXPECT_EQ(instruction.affectedAccounts(), std::vector<std::string>{"acc-1"});
}

TEST(InstructionTest, Describe) {
    EXPECT_EQ(Instruction::transfer("acc-a", "acc-b", amount(10000)).describe(),
              "transfer 100.00 acc-a -> acc-b");
    EXPECT_EQ(Instruction::deposit("acc-a", amount(5000)).describe(), "deposit 50.00 acc-a");
}

TEST(InstructionTest, EqualityByValue) {
    EXPECT_EQ(Instruction::deposit("acc-1", amount(100)), Instruction::deposit("acc-1", amount(100)));
    EXPECT_FALSE(Instruction::deposit("acc-1", amount(100)) == Instruction::withdrawal("acc-1", amount(100)));
}
