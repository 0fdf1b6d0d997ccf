#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAccountService.hpp"
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace banking::adapters::primary
{

    /**
     * @brief POST /api/v1/accounts: открыть счёт
     *
     * Тело: {"username": "...", "phone": "..."}
     * 201: счёт создан, 400: некорректные данные, 409: телефон уже занят
     */
    class CreateAccountHandler : public IHttpHandler
    {
    public:
        explicit CreateAccountHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[CreateAccountHandler] Created" << std::endl;
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
                if (!body.is_object())
                {
                    sendError(res, 400, "Request body must be a JSON object");
                    return;
                }

                ports::input::CreateAccountRequest request;
                request.username = body.value("username", "");
                request.phone = body.value("phone", "");

                auto account = accountService_->createAccount(request);
                res.setResult(201, "application/json", account.toJson().dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const domain::ValidationError &e)
            {
                sendError(res, 400, e.what());
            }
            catch (const domain::AlreadyExistsError &e)
            {
                sendError(res, 409, "Phone number already registered");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CreateAccountHandler] Error: " << e.what() << std::endl;
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
