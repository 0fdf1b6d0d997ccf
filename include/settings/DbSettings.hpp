// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace banking::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения (K8s ENV):
     * - BANKING_DB_HOST (default: "banking-postgres")
     * - BANKING_DB_PORT (default: 5432)
     * - BANKING_DB_NAME (default: "banking_db")
     * - BANKING_DB_USER (default: "banking_user")
     * - BANKING_DB_PASSWORD
     * - BANKING_DB_LOCK_TIMEOUT_MS (default: 5000): ожидание блокировки строки
     * - DATABASE_URL: если задан, заменяет собранную строку подключения
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("BANKING_DB_HOST", "banking-postgres");
            port_ = std::stoi(getEnvOrDefault("BANKING_DB_PORT", "5432"));
            name_ = getEnvOrDefault("BANKING_DB_NAME", "banking_db");
            user_ = getEnvOrDefault("BANKING_DB_USER", "banking_user");
            password_ = getEnvOrDefault("BANKING_DB_PASSWORD", "banking_secret_password");
            lockTimeoutMs_ = std::stoi(getEnvOrDefault("BANKING_DB_LOCK_TIMEOUT_MS", "5000"));
            databaseUrl_ = getEnvOrDefault("DATABASE_URL", "");

            if (lockTimeoutMs_ < 0)
            {
                throw std::invalid_argument("BANKING_DB_LOCK_TIMEOUT_MS must be >= 0");
            }
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }
        int getLockTimeoutMs() const { return lockTimeoutMs_; }

        std::string getConnectionString() const
        {
            if (!databaseUrl_.empty())
            {
                return databaseUrl_;
            }
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int lockTimeoutMs_;
        std::string databaseUrl_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace banking::settings
