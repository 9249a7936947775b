#pragma once

#include "ports/output/IBankAccountDirectory.hpp"
#include "PostgresConnection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::secondary {

class PostgresBankAccountDirectory : public ports::output::IBankAccountDirectory {
public:
    explicit PostgresBankAccountDirectory(std::shared_ptr<PostgresConnection> db)
        : db_(std::move(db))
    {
        std::cout << "[PostgresBankAccountDirectory] Created" << std::endl;
    }

    std::optional<domain::BankAccount> getById(int64_t bankAccountId) override {
        return db_->inTransaction("getById", [&](pqxx::work& txn) -> std::optional<domain::BankAccount> {
            auto result = txn.exec_params(
                R"(SELECT id, gl_account_id, currency_code, account_name, is_active
                   FROM business.bank_accounts WHERE id = $1)",
                bankAccountId
            );
            txn.commit();

            if (result.empty()) return std::nullopt;

            const auto& row = result[0];
            domain::BankAccount account;
            account.id = row["id"].as<int64_t>();
            account.glAccountId = row["gl_account_id"].is_null() ? 0 : row["gl_account_id"].as<int64_t>();
            account.currencyCode = row["currency_code"].as<std::string>();
            account.name = row["account_name"].as<std::string>();
            account.isActive = row["is_active"].as<bool>();
            return account;
        });
    }

private:
    std::shared_ptr<PostgresConnection> db_;
};

} // namespace reconciliation::adapters::secondary
