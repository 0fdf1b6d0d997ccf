// include/BankingApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/ProcessorSettings.hpp"

// Ports
#include "ports/input/IAccountService.hpp"
#include "ports/input/IBalanceMutator.hpp"
#include "ports/input/ITransactionService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IBalanceStore.hpp"
#include "ports/output/IDeliveryChannel.hpp"
#include "ports/output/IInstructionPublisher.hpp"
#include "ports/output/ILedgerRepository.hpp"

// Application
#include "application/AccountService.hpp"
#include "application/BalanceMutator.hpp"
#include "application/TransactionProcessor.hpp"
#include "application/TransactionService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/PostgresBalanceStore.hpp"
#include "adapters/secondary/PostgresLedgerRepository.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CreateAccountHandler.hpp"
#include "adapters/primary/GetAccountsHandler.hpp"
#include "adapters/primary/GetAccountHandler.hpp"
#include "adapters/primary/SubmitTransactionHandler.hpp"
#include "adapters/primary/GetTransactionHistoryHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace banking
{

    /**
     * @brief Banking Service Application
     *
     * HTTP: счета, приём транзакций (публикация в transaction_queue), история
     * Фон: TransactionProcessor читает transaction_queue и применяет инструкции
     * Хранилище: PostgreSQL (accounts + ledger_entries в одной базе)
     */
    class BankingApp : public BoostBeastApplication
    {
    public:
        BankingApp() { std::cout << "[BankingApp] Initializing..." << std::endl; }

        ~BankingApp() override
        {
            std::cout << "[BankingApp] Shutting down..." << std::endl;
            // Сначала процессор: отменяет подписку, дожидается ack текущей доставки, закрывает канал
            if (processor_)
            {
                processor_->stop();
            }
            if (rabbitMQAdapter_)
            {
                rabbitMQAdapter_->stop();
            }
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[BankingApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[BankingApp] Configuring DI..." << std::endl;

            // Шаг 1: RabbitMQAdapter (один экземпляр для Publisher и DeliveryChannel)
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 2: Основной injector с instance binding для RabbitMQ
            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::ProcessorSettings>().in(di::singleton),

                di::bind<ports::output::IAccountRepository>().to<adapters::secondary::PostgresAccountRepository>().in(di::singleton),
                di::bind<ports::output::ILedgerRepository>().to<adapters::secondary::PostgresLedgerRepository>().in(di::singleton),
                di::bind<ports::output::IBalanceStore>().to<adapters::secondary::PostgresBalanceStore>().in(di::singleton),

                di::bind<ports::output::IInstructionPublisher>().to(rabbitMQAdapter_),
                di::bind<ports::output::IDeliveryChannel>().to(rabbitMQAdapter_),

                di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton),
                di::bind<ports::input::ITransactionService>().to<application::TransactionService>().in(di::singleton),
                di::bind<ports::input::IBalanceMutator>().to<application::BalanceMutator>().in(di::singleton),
                di::bind<application::TransactionProcessor>().in(di::singleton));

            // Шаг 3: Схема БД, один раз до первого обращения репозиториев
            adapters::secondary::initSchema(*injector.create<std::shared_ptr<settings::DbSettings>>());

            // Шаг 4: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            handlers_[getHandlerKey("POST", "/api/v1/accounts")] = injector.create<std::shared_ptr<adapters::primary::CreateAccountHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/accounts")] = injector.create<std::shared_ptr<adapters::primary::GetAccountsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/accounts/*")] = injector.create<std::shared_ptr<adapters::primary::GetAccountHandler>>();

            handlers_[getHandlerKey("POST", "/api/v1/transactions")] = injector.create<std::shared_ptr<adapters::primary::SubmitTransactionHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/transactions/*")] = injector.create<std::shared_ptr<adapters::primary::GetTransactionHistoryHandler>>();

            // Шаг 5: Запускаем RabbitMQ и процессор ПОСЛЕ регистрации handlers
            std::cout << "[BankingApp] Starting RabbitMQ..." << std::endl;
            rabbitMQAdapter_->start();

            processor_ = injector.create<std::shared_ptr<application::TransactionProcessor>>();
            auto processorSettings = injector.create<std::shared_ptr<settings::ProcessorSettings>>();
            if (processorSettings->isEnabled())
            {
                processor_->start();
            }
            else
            {
                std::cout << "[BankingApp] TransactionProcessor disabled (PROCESSOR_ENABLED=false)" << std::endl;
            }

            std::cout << "[BankingApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
        std::shared_ptr<application::TransactionProcessor> processor_;
    };

} // namespace banking
