#pragma once

#include "settings/DbSettings.hpp"
#include "domain/ReconciliationError.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>
#include <iostream>

namespace reconciliation::adapters::secondary {

/**
 * @brief Общее подключение к БД для всех Postgres-адаптеров
 *
 * Каждый вызов inTransaction() выполняется под мьютексом в своей pqxx::work.
 * Функция сама вызывает commit(); без commit транзакция откатывается
 * деструктором pqxx::work. Любая ошибка драйвера превращается
 * в domain::PersistenceError.
 */
class PostgresConnection {
public:
    explicit PostgresConnection(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresConnection] Connecting to " << settings_->getHost()
                  << ":" << settings_->getPort() << "/" << settings_->getName() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresConnection] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresConnection] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresConnection() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    template <typename Fn>
    auto inTransaction(const std::string& operation, Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            ensureOpen();
            pqxx::work txn(*connection_);
            return fn(txn);

        } catch (const domain::PersistenceError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresConnection] " << operation << " failed: " << e.what() << std::endl;
            throw domain::PersistenceError(operation + " failed: " + e.what());
        }
    }

    /**
     * @brief Литерал массива bigint для параметра "$n::bigint[]"
     */
    static std::string toArrayLiteral(const std::vector<int64_t>& ids) {
        std::string out = "{";
        for (size_t i = 0; i < ids.size(); ++i) {
            if (i > 0) out += ",";
            out += std::to_string(ids[i]);
        }
        out += "}";
        return out;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    void ensureOpen() {
        if (!connection_->is_open()) {
            std::cout << "[PostgresConnection] Reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        }
    }
};

} // namespace reconciliation::adapters::secondary
