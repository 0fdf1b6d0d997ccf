/**
 * @file TransactionProcessorTest.cpp
 * @brief Unit-тесты для TransactionProcessor
 *
 * Проверяется разрешение каждой доставки: ack / requeue / dead-letter.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/TransactionProcessor.hpp"
#include "application/BalanceMutator.hpp"
#include "mocks/FakeDeliveryChannel.hpp"
#include "mocks/InMemoryBank.hpp"

#include <atomic>
#include <chrono>
#include <limits>
#include <thread>

using namespace banking;
using namespace banking::tests::mocks;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;
using Kind = FakeDeliveryChannel::Settlement::Kind;

// ============================================================================
// Mocks
// ============================================================================

class MockBalanceMutator : public ports::input::IBalanceMutator
{
public:
    MOCK_METHOD(domain::MutationResult, apply, (const domain::Instruction &), (override));
};

/**
 * @brief Мутатор, который держит доставку, пока процессор не начнёт остановку
 */
class CancelAwaitingMutator : public ports::input::IBalanceMutator
{
public:
    explicit CancelAwaitingMutator(std::shared_ptr<FakeDeliveryChannel> channel)
        : channel_(std::move(channel)) {}

    domain::MutationResult apply(const domain::Instruction &) override
    {
        entered_ = true;
        sawCancel_ = channel_->waitForCancel();
        return domain::MutationResult::applied({});
    }

    bool waitUntilEntered(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!entered_ && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return entered_;
    }

    bool sawCancel() const { return sawCancel_; }

private:
    std::shared_ptr<FakeDeliveryChannel> channel_;
    std::atomic<bool> entered_{false};
    std::atomic<bool> sawCancel_{false};
};

// ============================================================================
// Test Fixture
// ============================================================================

class TransactionProcessorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        channel_ = std::make_shared<FakeDeliveryChannel>();
        mutator_ = std::make_shared<MockBalanceMutator>();
        settings_ = std::make_shared<settings::ProcessorSettings>();
        settings_->setMaxDeliveryAttempts(3);
        processor_ = std::make_unique<application::TransactionProcessor>(channel_, mutator_, settings_);
    }

    ports::output::Delivery delivery(const std::string &payload, uint32_t attempt = 1)
    {
        ports::output::Delivery d;
        d.deliveryTag = ++tag_;
        d.payload = payload;
        d.attempt = attempt;
        return d;
    }

    static std::string depositPayload()
    {
        return R"({"account_id": "acc-a", "type": "deposit", "amount": 50.0})";
    }

    std::shared_ptr<FakeDeliveryChannel> channel_;
    std::shared_ptr<MockBalanceMutator> mutator_;
    std::shared_ptr<settings::ProcessorSettings> settings_;
    std::unique_ptr<application::TransactionProcessor> processor_;
    uint64_t tag_ = 0;
};

// ============================================================================
// ТЕСТЫ: исход доставки
// ============================================================================

TEST_F(TransactionProcessorTest, Applied_Acknowledged)
{
    EXPECT_CALL(*mutator_, apply(domain::Instruction::deposit("acc-a", domain::Money::fromMinorUnits(5000))))
        .WillOnce(Return(domain::MutationResult::applied({})));

    auto outcome = processor_->processDelivery(delivery(depositPayload()));

    EXPECT_EQ(outcome, application::DeliveryOutcome::ACKNOWLEDGED);
    ASSERT_EQ(channel_->settlements().size(), 1u);
    EXPECT_EQ(channel_->settlements()[0].kind, Kind::ACK);
    EXPECT_EQ(channel_->settlements()[0].deliveryTag, 1u);
}

TEST_F(TransactionProcessorTest, InsufficientBalance_AcknowledgedNotRetried)
{
    EXPECT_CALL(*mutator_, apply(_))
        .WillOnce(Return(domain::MutationResult::failed(domain::MutationStatus::INSUFFICIENT_BALANCE, "low")));

    auto outcome = processor_->processDelivery(delivery(depositPayload()));

    EXPECT_EQ(outcome, application::DeliveryOutcome::ACKNOWLEDGED);
    EXPECT_EQ(channel_->count(Kind::ACK), 1u);
    EXPECT_EQ(processor_->getStats().rejectedTerminal, 1u);
}

TEST_F(TransactionProcessorTest, AccountNotFound_AcknowledgedNotRetried)
{
    EXPECT_CALL(*mutator_, apply(_))
        .WillOnce(Return(domain::MutationResult::failed(domain::MutationStatus::ACCOUNT_NOT_FOUND, "missing")));

    auto outcome = processor_->processDelivery(delivery(depositPayload()));

    EXPECT_EQ(outcome, application::DeliveryOutcome::ACKNOWLEDGED);
    EXPECT_EQ(channel_->count(Kind::REQUEUE), 0u);
}

TEST_F(TransactionProcessorTest, StoreUnavailable_Requeued)
{
    EXPECT_CALL(*mutator_, apply(_))
        .WillOnce(Return(domain::MutationResult::failed(domain::MutationStatus::STORE_UNAVAILABLE, "down")));

    auto outcome = processor_->processDelivery(delivery(depositPayload(), 1));

    EXPECT_EQ(outcome, application::DeliveryOutcome::REQUEUED);
    EXPECT_EQ(channel_->count(Kind::REQUEUE), 1u);
}

TEST_F(TransactionProcessorTest, StoreUnavailable_DeadLetteredOnLastAttempt)
{
    EXPECT_CALL(*mutator_, apply(_))
        .WillOnce(Return(domain::MutationResult::failed(domain::MutationStatus::STORE_UNAVAILABLE, "down")));

    auto outcome = processor_->processDelivery(delivery(depositPayload(), 3));

    EXPECT_EQ(outcome, application::DeliveryOutcome::DEAD_LETTERED);
    EXPECT_EQ(channel_->count(Kind::DEAD_LETTER), 1u);
}

TEST_F(TransactionProcessorTest, UnexpectedException_Requeued)
{
    EXPECT_CALL(*mutator_, apply(_))
        .WillOnce(Throw(std::runtime_error("boom")));

    auto outcome = processor_->processDelivery(delivery(depositPayload(), 2));

    EXPECT_EQ(outcome, application::DeliveryOutcome::REQUEUED);
}

TEST_F(TransactionProcessorTest, UndecodablePayload_RequeuedThenDeadLettered)
{
    EXPECT_CALL(*mutator_, apply(_)).Times(0);

    EXPECT_EQ(processor_->processDelivery(delivery("not json", 1)), application::DeliveryOutcome::REQUEUED);
    EXPECT_EQ(processor_->processDelivery(delivery("not json", 2)), application::DeliveryOutcome::REQUEUED);
    EXPECT_EQ(processor_->processDelivery(delivery("not json", 3)), application::DeliveryOutcome::DEAD_LETTERED);
}

TEST_F(TransactionProcessorTest, InvalidInstruction_TreatedAsPoison)
{
    EXPECT_CALL(*mutator_, apply(_)).Times(0);

    auto outcome = processor_->processDelivery(
        delivery(R"({"from_account_id": "a", "to_account_id": "a", "type": "transfer", "amount": 1})", 3));

    EXPECT_EQ(outcome, application::DeliveryOutcome::DEAD_LETTERED);
}

TEST_F(TransactionProcessorTest, UnboundedRetries_NeverDeadLetters)
{
    settings_->setMaxDeliveryAttempts(0);
    EXPECT_CALL(*mutator_, apply(_))
        .WillOnce(Return(domain::MutationResult::failed(domain::MutationStatus::STORE_UNAVAILABLE, "down")));

    auto outcome = processor_->processDelivery(delivery(depositPayload(), 1000));

    EXPECT_EQ(outcome, application::DeliveryOutcome::REQUEUED);
}

TEST_F(TransactionProcessorTest, Stats_CountEveryOutcome)
{
    EXPECT_CALL(*mutator_, apply(_))
        .WillOnce(Return(domain::MutationResult::applied({})))
        .WillOnce(Return(domain::MutationResult::failed(domain::MutationStatus::INSUFFICIENT_BALANCE, "low")))
        .WillOnce(Return(domain::MutationResult::failed(domain::MutationStatus::STORE_UNAVAILABLE, "down")));

    processor_->processDelivery(delivery(depositPayload()));
    processor_->processDelivery(delivery(depositPayload()));
    processor_->processDelivery(delivery(depositPayload()));
    processor_->processDelivery(delivery("garbage", 3));

    auto stats = processor_->getStats();
    EXPECT_EQ(stats.received, 4u);
    EXPECT_EQ(stats.acknowledged, 2u);
    EXPECT_EQ(stats.rejectedTerminal, 1u);
    EXPECT_EQ(stats.requeued, 1u);
    EXPECT_EQ(stats.deadLettered, 1u);
}

// ============================================================================
// ТЕСТЫ: рабочий поток
// ============================================================================

TEST_F(TransactionProcessorTest, Worker_DrainsChannelInOrder)
{
    ::testing::InSequence seq;
    EXPECT_CALL(*mutator_, apply(domain::Instruction::deposit("acc-a", domain::Money::fromMinorUnits(100))))
        .WillOnce(Return(domain::MutationResult::applied({})));
    EXPECT_CALL(*mutator_, apply(domain::Instruction::deposit("acc-a", domain::Money::fromMinorUnits(200))))
        .WillOnce(Return(domain::MutationResult::applied({})));

    processor_->start();
    channel_->deliver(R"({"account_id": "acc-a", "type": "deposit", "amount": 1})");
    channel_->deliver(R"({"account_id": "acc-a", "type": "deposit", "amount": 2})");

    ASSERT_TRUE(channel_->waitForSettlements(2));
    processor_->stop();

    EXPECT_EQ(channel_->count(Kind::ACK), 2u);
    EXPECT_TRUE(channel_->isStopped());
    EXPECT_FALSE(processor_->isRunning());
}

TEST_F(TransactionProcessorTest, Stop_SettlesInFlightDeliveryBeforeClosingChannel)
{
    auto mutator = std::make_shared<CancelAwaitingMutator>(channel_);
    application::TransactionProcessor processor(channel_, mutator, settings_);

    processor.start();
    auto inFlightTag = channel_->deliver(depositPayload());
    ASSERT_TRUE(mutator->waitUntilEntered());
    channel_->deliver(depositPayload());

    processor.stop();

    EXPECT_TRUE(mutator->sawCancel());
    ASSERT_EQ(channel_->settlements().size(), 1u);
    EXPECT_EQ(channel_->settlements()[0].deliveryTag, inFlightTag);
    EXPECT_EQ(channel_->settlements()[0].kind, Kind::ACK);
    EXPECT_EQ(channel_->settledAfterStop(), 0u);
    EXPECT_TRUE(channel_->isStopped());
    EXPECT_EQ(processor.getStats().acknowledged, 1u);
}

TEST_F(TransactionProcessorTest, Redelivered_IsLoggedOnRequeue)
{
    EXPECT_CALL(*mutator_, apply(_))
        .WillOnce(Return(domain::MutationResult::failed(domain::MutationStatus::STORE_UNAVAILABLE, "down")));

    auto d = delivery(depositPayload(), 2);
    d.redelivered = true;

    ::testing::internal::CaptureStderr();
    auto outcome = processor_->processDelivery(d);
    auto log = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(outcome, application::DeliveryOutcome::REQUEUED);
    EXPECT_THAT(log, HasSubstr("REQUEUE tag=1 attempt 2 (redelivered)"));
}

TEST_F(TransactionProcessorTest, Stop_IsIdempotent)
{
    processor_->start();
    processor_->stop();
    processor_->stop();

    EXPECT_FALSE(processor_->isRunning());
}

// ============================================================================
// ТЕСТЫ: процессор + BalanceMutator + InMemoryBank
// ============================================================================

TEST(TransactionProcessorIntegrationTest, QueuedInstructionsReachLedger)
{
    auto bank = std::make_shared<InMemoryBank>();
    bank->addAccount("acc-a", 10000);
    bank->addAccount("acc-b", 0);

    auto channel = std::make_shared<FakeDeliveryChannel>();
    auto mutator = std::make_shared<application::BalanceMutator>(bank);
    auto processorSettings = std::make_shared<settings::ProcessorSettings>();
    application::TransactionProcessor processor(channel, mutator, processorSettings);

    processor.start();
    channel->deliver(R"({"account_id": "acc-a", "type": "deposit", "amount": 50})");
    channel->deliver(R"({"account_id": "acc-a", "type": "withdrawal", "amount": 200})");
    channel->deliver(R"({"from_account_id": "acc-a", "to_account_id": "acc-b", "type": "transfer", "amount": 100})");
    ASSERT_TRUE(channel->waitForSettlements(3));
    processor.stop();

    EXPECT_EQ(channel->count(Kind::ACK), 3u);
    EXPECT_EQ(bank->balanceOf("acc-a"), 5000);
    EXPECT_EQ(bank->balanceOf("acc-b"), 10000);
    EXPECT_EQ(bank->findByAccountId("acc-a").size(), 2u);
    EXPECT_EQ(processor.getStats().rejectedTerminal, 1u);
}

TEST(TransactionProcessorIntegrationTest, TransientFailureRetriedOnRedelivery)
{
    auto bank = std::make_shared<InMemoryBank>();
    bank->addAccount("acc-a", 10000);

    auto channel = std::make_shared<FakeDeliveryChannel>();
    auto mutator = std::make_shared<application::BalanceMutator>(bank);
    auto processorSettings = std::make_shared<settings::ProcessorSettings>();
    application::TransactionProcessor processor(channel, mutator, processorSettings);

    const std::string payload = R"({"account_id": "acc-a", "type": "deposit", "amount": 10})";
    bank->failNextCommit();

    ports::output::Delivery first;
    first.deliveryTag = 1;
    first.payload = payload;
    first.attempt = 1;
    EXPECT_EQ(processor.processDelivery(first), application::DeliveryOutcome::REQUEUED);
    EXPECT_EQ(bank->balanceOf("acc-a"), 10000);

    ports::output::Delivery second = first;
    second.deliveryTag = 2;
    second.attempt = 2;
    second.redelivered = true;
    EXPECT_EQ(processor.processDelivery(second), application::DeliveryOutcome::ACKNOWLEDGED);
    EXPECT_EQ(bank->balanceOf("acc-a"), 11000);
}

TEST(TransactionProcessorIntegrationTest, BalanceOverflowAcknowledgedNotRetried)
{
    auto bank = std::make_shared<InMemoryBank>();
    bank->addAccount("acc-a", std::numeric_limits<int64_t>::max() - 10);

    auto channel = std::make_shared<FakeDeliveryChannel>();
    auto mutator = std::make_shared<application::BalanceMutator>(bank);
    auto processorSettings = std::make_shared<settings::ProcessorSettings>();
    application::TransactionProcessor processor(channel, mutator, processorSettings);

    ports::output::Delivery d;
    d.deliveryTag = 1;
    d.payload = R"({"account_id": "acc-a", "type": "deposit", "amount": 1})";
    d.attempt = 1;

    EXPECT_EQ(processor.processDelivery(d), application::DeliveryOutcome::ACKNOWLEDGED);
    EXPECT_EQ(channel->count(Kind::REQUEUE), 0u);
    EXPECT_EQ(processor.getStats().rejectedTerminal, 1u);
    EXPECT_EQ(bank->balanceOf("acc-a"), std::numeric_limits<int64_t>::max() - 10);
}
