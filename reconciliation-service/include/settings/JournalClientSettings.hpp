#pragma once

#include "IJournalClientSettings.hpp"
#include <string>
#include <cstdlib>

namespace reconciliation::settings {

/**
 * @brief Адрес сервиса журнала проводок
 *
 * Читает из ENV:
 * - JOURNAL_SERVICE_HOST (default: "journal-service")
 * - JOURNAL_SERVICE_PORT (default: 8080)
 */
class JournalClientSettings : public IJournalClientSettings {
public:
    JournalClientSettings() {
        if (const char* host = std::getenv("JOURNAL_SERVICE_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("JOURNAL_SERVICE_PORT")) {
            port_ = std::stoi(port);
        }
    }

    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }

private:
    std::string host_ = "journal-service";
    int port_ = 8080;
};

} // namespace reconciliation::settings
