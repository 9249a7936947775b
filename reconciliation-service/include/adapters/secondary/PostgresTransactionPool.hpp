#pragma once

#include "ports/output/ITransactionPool.hpp"
#include "PostgresConnection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::secondary {

/**
 * @brief business.bank_transactions в PostgreSQL
 *
 * claim/release сначала берут FOR SHARE на строки сверок: конкурирующая
 * финализация ждёт коммита, а уже финализированная сверка видна как
 * 'Finalized'. Затем условный UPDATE; если затронуто меньше строк,
 * чем передано id, транзакция откатывается без commit.
 */
class PostgresTransactionPool : public ports::output::ITransactionPool {
public:
    explicit PostgresTransactionPool(std::shared_ptr<PostgresConnection> db)
        : db_(std::move(db))
    {
        std::cout << "[PostgresTransactionPool] Created" << std::endl;
    }

    domain::TransactionPartition getUnreconciled(
        int64_t bankAccountId, const domain::Date& asOfDate) override
    {
        return db_->inTransaction("getUnreconciled", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                selectSql() +
                R"( WHERE t.bank_account_id = $1
                      AND t.is_reconciled = FALSE
                      AND t.transaction_date <= $2::date
                    ORDER BY t.transaction_date, t.id)",
                bankAccountId,
                asOfDate.toString()
            );
            txn.commit();
            return toPartition(result);
        });
    }

    domain::TransactionPartition getItemsForReconciliation(int64_t reconciliationId) override {
        return db_->inTransaction("getItemsForReconciliation", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                selectSql() +
                R"( WHERE t.reconciled_bank_reconciliation_id = $1
                    ORDER BY t.transaction_date, t.id)",
                reconciliationId
            );
            txn.commit();
            return toPartition(result);
        });
    }

    std::vector<domain::BankTransaction> findByIds(const std::vector<int64_t>& ids) override {
        if (ids.empty()) return {};

        return db_->inTransaction("findByIds", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                selectSql() + " WHERE t.id = ANY($1::bigint[]) ORDER BY t.id",
                PostgresConnection::toArrayLiteral(ids)
            );
            txn.commit();

            std::vector<domain::BankTransaction> rows;
            for (const auto& row : result) {
                rows.push_back(rowToTransaction(row));
            }
            return rows;
        });
    }

    bool claim(int64_t reconciliationId,
               int64_t bankAccountId,
               const std::vector<int64_t>& ids,
               const domain::Date& statementDate) override
    {
        if (ids.empty()) return false;

        return db_->inTransaction("claim", [&](pqxx::work& txn) {
            auto rec = txn.exec_params(
                R"(SELECT status FROM business.bank_reconciliations
                   WHERE id = $1 AND bank_account_id = $2 FOR SHARE)",
                reconciliationId,
                bankAccountId
            );
            if (rec.empty() || rec[0]["status"].as<std::string>() != "Draft") {
                return false;
            }

            auto updated = txn.exec_params(
                R"(
                    UPDATE business.bank_transactions SET
                        is_reconciled = TRUE,
                        reconciled_date = $3::date,
                        reconciled_bank_reconciliation_id = $1,
                        updated_at = CURRENT_TIMESTAMP
                    WHERE id = ANY($4::bigint[])
                      AND bank_account_id = $2
                      AND is_reconciled = FALSE
                )",
                reconciliationId,
                bankAccountId,
                statementDate.toString(),
                PostgresConnection::toArrayLiteral(ids)
            );

            if (updated.affected_rows() != ids.size()) {
                std::cout << "[PostgresTransactionPool] claim: " << updated.affected_rows()
                          << " of " << ids.size() << " rows available, rolled back" << std::endl;
                return false;
            }

            txn.commit();
            return true;
        });
    }

    bool release(const std::vector<int64_t>& ids) override {
        if (ids.empty()) return false;

        return db_->inTransaction("release", [&](pqxx::work& txn) {
            const std::string idArray = PostgresConnection::toArrayLiteral(ids);

            auto owners = txn.exec_params(
                R"(
                    SELECT r.id, r.status FROM business.bank_reconciliations r
                    WHERE r.id IN (
                        SELECT reconciled_bank_reconciliation_id FROM business.bank_transactions
                        WHERE id = ANY($1::bigint[])
                    )
                    FOR SHARE
                )",
                idArray
            );
            for (const auto& row : owners) {
                if (row["status"].as<std::string>() != "Draft") {
                    return false;
                }
            }

            auto updated = txn.exec_params(
                R"(
                    UPDATE business.bank_transactions t SET
                        is_reconciled = FALSE,
                        reconciled_date = NULL,
                        reconciled_bank_reconciliation_id = NULL,
                        updated_at = CURRENT_TIMESTAMP
                    FROM business.bank_reconciliations r
                    WHERE t.id = ANY($1::bigint[])
                      AND t.is_reconciled = TRUE
                      AND r.id = t.reconciled_bank_reconciliation_id
                      AND r.status = 'Draft'
                )",
                idArray
            );

            if (updated.affected_rows() != ids.size()) {
                std::cout << "[PostgresTransactionPool] release: " << updated.affected_rows()
                          << " of " << ids.size() << " rows releasable, rolled back" << std::endl;
                return false;
            }

            txn.commit();
            return true;
        });
    }

private:
    std::shared_ptr<PostgresConnection> db_;

    static std::string selectSql() {
        return R"(
            SELECT t.id, t.bank_account_id,
                   to_char(t.transaction_date, 'YYYY-MM-DD') AS transaction_date,
                   t.amount::text AS amount,
                   t.description, t.reference, t.transaction_type,
                   t.is_from_statement, t.is_reconciled,
                   to_char(t.reconciled_date, 'YYYY-MM-DD') AS reconciled_date,
                   t.reconciled_bank_reconciliation_id,
                   a.currency_code
            FROM business.bank_transactions t
            JOIN business.bank_accounts a ON a.id = t.bank_account_id
        )";
    }

    static domain::TransactionPartition toPartition(const pqxx::result& result) {
        domain::TransactionPartition partition;
        for (const auto& row : result) {
            auto txn = rowToTransaction(row);
            if (txn.isFromStatement) {
                partition.statementItems.push_back(std::move(txn));
            } else {
                partition.systemItems.push_back(std::move(txn));
            }
        }
        return partition;
    }

    static domain::BankTransaction rowToTransaction(const pqxx::row& row) {
        domain::BankTransaction txn;
        txn.id = row["id"].as<int64_t>();
        txn.bankAccountId = row["bank_account_id"].as<int64_t>();
        txn.transactionDate = domain::Date::fromString(row["transaction_date"].as<std::string>());
        txn.amount = domain::Money::fromString(
            row["amount"].as<std::string>(), row["currency_code"].as<std::string>());
        txn.description = row["description"].as<std::string>();
        txn.reference = row["reference"].is_null() ? "" : row["reference"].as<std::string>();
        txn.type = domain::parseTransactionType(row["transaction_type"].as<std::string>());
        txn.isFromStatement = row["is_from_statement"].as<bool>();
        txn.isReconciled = row["is_reconciled"].as<bool>();
        if (!row["reconciled_date"].is_null()) {
            txn.reconciledDate = domain::Date::fromString(row["reconciled_date"].as<std::string>());
        }
        if (!row["reconciled_bank_reconciliation_id"].is_null()) {
            txn.reconciliationId = row["reconciled_bank_reconciliation_id"].as<int64_t>();
        }
        return txn;
    }
};

} // namespace reconciliation::adapters::secondary
