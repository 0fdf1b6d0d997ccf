#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITransactionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace banking::adapters::primary
{

    /**
     * @brief GET /api/v1/transactions/{account_id}: история операций счёта
     *
     * Роутер регистрирует с паттерном "/api/v1/transactions/*".
     * Записи отдаются от старых к новым.
     */
    class GetTransactionHistoryHandler : public IHttpHandler
    {
    public:
        explicit GetTransactionHistoryHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[GetTransactionHistoryHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                std::string accountId = req.getPathParam(0).value_or("");
                if (accountId.empty())
                {
                    sendError(res, 400, "Account ID is required");
                    return;
                }

                auto entries = transactionService_->getHistory(accountId);
                if (entries.empty())
                {
                    sendError(res, 404, "No transactions found for this account");
                    return;
                }

                nlohmann::json response;
                response["transactions"] = nlohmann::json::array();
                for (const auto &entry : entries)
                {
                    response["transactions"].push_back(entry.toJson());
                }

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetTransactionHistoryHandler] Error: " << e.what() << std::endl;
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
