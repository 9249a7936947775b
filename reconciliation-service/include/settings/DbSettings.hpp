#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace reconciliation::settings {

/**
 * @brief Подключение к PostgreSQL бухгалтерии
 *
 * RECON_DB_PASSWORD обязателен, остальное имеет значения по умолчанию.
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("RECON_DB_HOST", "recon-postgres");
        port_ = std::stoi(getEnvOrDefault("RECON_DB_PORT", "5432"));
        name_ = getEnvOrDefault("RECON_DB_NAME", "bookkeeping_db");
        user_ = getEnvOrDefault("RECON_DB_USER", "recon_user");
        password_ = getEnvOrThrow("RECON_DB_PASSWORD");
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace reconciliation::settings
