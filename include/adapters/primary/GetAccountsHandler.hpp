#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAccountService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace banking::adapters::primary
{

    /**
     * @brief GET /api/v1/accounts: все счета
     */
    class GetAccountsHandler : public IHttpHandler
    {
    public:
        explicit GetAccountsHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[GetAccountsHandler] Created" << std::endl;
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
                auto accounts = accountService_->getAccounts();
                if (accounts.empty())
                {
                    sendError(res, 404, "No accounts found");
                    return;
                }

                nlohmann::json response;
                response["accounts"] = nlohmann::json::array();
                for (const auto &account : accounts)
                {
                    response["accounts"].push_back(account.toJson());
                }

                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetAccountsHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace banking::adapters::primary
