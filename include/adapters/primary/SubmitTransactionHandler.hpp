#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITransactionService.hpp"
#include "domain/InstructionCodec.hpp"
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace banking::adapters::primary
{

    /**
     * @brief POST /api/v1/transactions: поставить транзакцию в очередь
     *
     * Тело совпадает с форматом сообщения в очереди:
     * {"type": "deposit|withdrawal|transfer", "amount": 50.0,
     *  "account_id": "..."} или {"from_account_id": "...", "to_account_id": "..."}
     *
     * 202: принято к обработке (баланс изменится асинхронно)
     * 400: некорректная инструкция, 404: нет счёта,
     * 409: недостаточно средств, 503: очередь недоступна
     */
    class SubmitTransactionHandler : public IHttpHandler
    {
    public:
        explicit SubmitTransactionHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[SubmitTransactionHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());
                auto instruction = domain::InstructionCodec::fromJson(body);

                auto result = transactionService_->submit(instruction);

                switch (result.status)
                {
                case domain::SubmitStatus::ACCEPTED:
                {
                    auto response = domain::InstructionCodec::toJson(instruction);
                    response["message"] = result.message;
                    res.setResult(202, "application/json", response.dump());
                    return;
                }
                case domain::SubmitStatus::ACCOUNT_NOT_FOUND:
                    sendError(res, 404, result.message);
                    return;
                case domain::SubmitStatus::INSUFFICIENT_BALANCE:
                    sendError(res, 409, result.message);
                    return;
                case domain::SubmitStatus::QUEUE_UNAVAILABLE:
                    sendError(res, 503, result.message);
                    return;
                }
                sendError(res, 500, "Internal server error");
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const domain::ValidationError &e)
            {
                sendError(res, 400, e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SubmitTransactionHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace banking::adapters::primary
