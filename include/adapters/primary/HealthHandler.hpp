#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "application/TransactionProcessor.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace banking::adapters::primary {

/**
 * @brief GET /health: статус сервиса и счётчики TransactionProcessor
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<application::TransactionProcessor> processor)
        : processor_(std::move(processor)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto stats = processor_->getStats();

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "banking-service";
        response["version"] = "1.0.0";
        response["processor"]["running"] = processor_->isRunning();
        response["processor"]["received"] = stats.received;
        response["processor"]["acknowledged"] = stats.acknowledged;
        response["processor"]["requeued"] = stats.requeued;
        response["processor"]["dead_lettered"] = stats.deadLettered;
        response["processor"]["rejected_terminal"] = stats.rejectedTerminal;

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<application::TransactionProcessor> processor_;
};

} // namespace banking::adapters::primary
