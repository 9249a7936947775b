#pragma once

#include "ports/output/IBalanceOracle.hpp"
#include "PostgresConnection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::secondary {

/**
 * @brief Остаток GL-счёта из accounting.*
 *
 * opening_balance + сумма (debit - credit) проведённых строк с entry_date <= asOfDate;
 * если задана opening_balance_date, обороты считаются начиная с неё.
 */
class PostgresBalanceOracle : public ports::output::IBalanceOracle {
public:
    explicit PostgresBalanceOracle(std::shared_ptr<PostgresConnection> db)
        : db_(std::move(db))
    {
        std::cout << "[PostgresBalanceOracle] Created" << std::endl;
    }

    domain::Money getAccountBalance(int64_t glAccountId, const domain::Date& asOfDate) override {
        return db_->inTransaction("getAccountBalance", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                R"(
                    SELECT (COALESCE(a.opening_balance, 0) + COALESCE((
                        SELECT SUM(l.debit_amount - l.credit_amount)
                        FROM accounting.journal_entry_lines l
                        JOIN accounting.journal_entries e ON e.id = l.journal_entry_id
                        WHERE l.account_id = a.id
                          AND e.is_posted = TRUE
                          AND e.entry_date <= $2::date
                          AND (a.opening_balance_date IS NULL OR e.entry_date >= a.opening_balance_date)
                    ), 0))::text AS balance
                    FROM accounting.accounts a
                    WHERE a.id = $1
                )",
                glAccountId,
                asOfDate.toString()
            );
            txn.commit();

            if (result.empty()) {
                throw domain::PersistenceError("GL account " + std::to_string(glAccountId) + " not found");
            }
            return domain::Money::fromString(result[0]["balance"].as<std::string>());
        });
    }

private:
    std::shared_ptr<PostgresConnection> db_;
};

} // namespace reconciliation::adapters::secondary
