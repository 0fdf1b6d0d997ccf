#include "BankingApp.hpp"
#include <iostream>
#include <csignal>

// Приложение, которое останавливает обработчик сигнала
banking::BankingApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        banking::BankingApp app;
        g_app = &app;

        // SIGTERM: процессор дорабатывает текущую доставку, неподтверждённые вернутся в очередь
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "[main] Banking Service v1.0.0: accounts API + transaction processor" << std::endl;

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Banking Service stopped, queue consumer closed" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
