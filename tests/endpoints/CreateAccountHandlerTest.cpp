/**
 * @file CreateAccountHandlerTest.cpp
 * @brief Unit-тесты для CreateAccountHandler
 *
 * POST /api/v1/accounts: открыть счёт
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/CreateAccountHandler.hpp"
#include "mocks/MockAccountService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace banking;
using namespace banking::adapters::primary;
using namespace banking::tests::mocks;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;
using ::testing::AllOf;

class CreateAccountHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mockAccountService_ = std::make_shared<MockAccountService>();
        handler_ = std::make_unique<CreateAccountHandler>(mockAccountService_);
    }

    SimpleRequest createRequest(const std::string &method, const std::string &body = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath("/api/v1/accounts");
        req.setBody(body);
        return req;
    }

    domain::Account createAccount(const std::string &id)
    {
        domain::Account account;
        account.accountId = id;
        account.username = "alice";
        account.phone = "9161234567";
        return account;
    }

    nlohmann::json parseJson(const std::string &body)
    {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockAccountService> mockAccountService_;
    std::unique_ptr<CreateAccountHandler> handler_;
};

TEST_F(CreateAccountHandlerTest, ValidRequest_Returns201)
{
    EXPECT_CALL(*mockAccountService_, createAccount(AllOf(
                                          Field(&ports::input::CreateAccountRequest::username, "alice"),
                                          Field(&ports::input::CreateAccountRequest::phone, "916-123-45-67"))))
        .WillOnce(Return(createAccount("acc-0000000000000001")));

    auto req = createRequest("POST", R"({"username": "alice", "phone": "916-123-45-67"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["account_id"], "acc-0000000000000001");
    EXPECT_EQ(json["username"], "alice");
    EXPECT_DOUBLE_EQ(json["balance"].get<double>(), 0.0);
}

TEST_F(CreateAccountHandlerTest, ValidationError_Returns400)
{
    EXPECT_CALL(*mockAccountService_, createAccount(_))
        .WillOnce(Throw(domain::ValidationError("Username must be at least 4 characters long")));

    auto req = createRequest("POST", R"({"username": "bob", "phone": "9161234567"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Username must be at least 4 characters long");
}

TEST_F(CreateAccountHandlerTest, DuplicatePhone_Returns409)
{
    EXPECT_CALL(*mockAccountService_, createAccount(_))
        .WillOnce(Throw(domain::AlreadyExistsError("duplicate key")));

    auto req = createRequest("POST", R"({"username": "alice", "phone": "9161234567"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
}

TEST_F(CreateAccountHandlerTest, InvalidJson_Returns400)
{
    EXPECT_CALL(*mockAccountService_, createAccount(_)).Times(0);

    auto req = createRequest("POST", "{broken");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Invalid JSON");
}

TEST_F(CreateAccountHandlerTest, StoreFailure_Returns500)
{
    EXPECT_CALL(*mockAccountService_, createAccount(_))
        .WillOnce(Throw(domain::StoreUnavailableError("connection lost")));

    auto req = createRequest("POST", R"({"username": "alice", "phone": "9161234567"})");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

TEST_F(CreateAccountHandlerTest, WrongMethod_Returns405)
{
    auto req = createRequest("GET");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
