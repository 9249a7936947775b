#pragma once

#include "ports/output/IReconciliationRepository.hpp"
#include "PostgresConnection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::secondary {

/**
 * @brief business.bank_reconciliations в PostgreSQL
 *
 * Единственность открытого черновика держит частичный уникальный индекс
 * uq_bank_reconciliations_open_draft, поэтому getOrCreateDraft выполняется одним upsert.
 */
class PostgresReconciliationRepository : public ports::output::IReconciliationRepository {
public:
    explicit PostgresReconciliationRepository(std::shared_ptr<PostgresConnection> db)
        : db_(std::move(db))
    {
        std::cout << "[PostgresReconciliationRepository] Created" << std::endl;
    }

    domain::Reconciliation getOrCreateDraft(
        int64_t bankAccountId,
        const domain::Date& statementDate,
        const domain::Money& statementEndingBalance,
        const std::optional<std::string>& notes,
        int64_t actorId) override
    {
        return db_->inTransaction("getOrCreateDraft", [&](pqxx::work& txn) {
            auto inserted = txn.exec_params(
                R"(
                    INSERT INTO business.bank_reconciliations
                        (bank_account_id, statement_date, statement_ending_balance,
                         notes, created_by_user_id, status)
                    VALUES ($1, $2::date, $3::numeric, $4, $5, 'Draft')
                    ON CONFLICT (bank_account_id, statement_date) WHERE status = 'Draft'
                    DO UPDATE SET
                        statement_ending_balance = EXCLUDED.statement_ending_balance,
                        notes = COALESCE(EXCLUDED.notes, business.bank_reconciliations.notes),
                        updated_at = CURRENT_TIMESTAMP
                    RETURNING id
                )",
                bankAccountId,
                statementDate.toString(),
                statementEndingBalance.toString(),
                notes,
                actorId
            );

            int64_t id = inserted[0]["id"].as<int64_t>();
            auto result = txn.exec_params(selectSql() + " WHERE r.id = $1", id);
            txn.commit();

            return rowToReconciliation(result[0]);
        });
    }

    std::optional<domain::Reconciliation> findById(int64_t reconciliationId) override {
        return db_->inTransaction("findById", [&](pqxx::work& txn) -> std::optional<domain::Reconciliation> {
            auto result = txn.exec_params(selectSql() + " WHERE r.id = $1", reconciliationId);
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToReconciliation(result[0]);
        });
    }

    domain::ReconciliationPage findFinalized(int64_t bankAccountId, int page, int pageSize) override {
        return db_->inTransaction("findFinalized", [&](pqxx::work& txn) {
            auto count = txn.exec_params(
                R"(SELECT COUNT(*) AS total FROM business.bank_reconciliations
                   WHERE bank_account_id = $1 AND status = 'Finalized')",
                bankAccountId
            );

            auto result = txn.exec_params(
                selectSql() +
                R"( WHERE r.bank_account_id = $1 AND r.status = 'Finalized'
                    ORDER BY r.statement_date DESC, r.id DESC
                    LIMIT $2 OFFSET $3)",
                bankAccountId,
                pageSize,
                static_cast<int64_t>(page - 1) * pageSize
            );
            txn.commit();

            domain::ReconciliationPage out;
            out.totalCount = count[0]["total"].as<int64_t>();
            for (const auto& row : result) {
                out.items.push_back(rowToReconciliation(row));
            }
            return out;
        });
    }

    bool finalize(const ports::output::FinalizeCommand& command) override {
        return db_->inTransaction("finalize", [&](pqxx::work& txn) {
            auto updated = txn.exec_params(
                R"(
                    UPDATE business.bank_reconciliations SET
                        status = 'Finalized',
                        statement_ending_balance = $2::numeric,
                        calculated_book_balance = $3::numeric,
                        reconciled_difference = $4::numeric,
                        finalized_at = to_timestamp($5),
                        updated_at = CURRENT_TIMESTAMP
                    WHERE id = $1 AND status = 'Draft'
                )",
                command.reconciliationId,
                command.statementEndingBalance.toString(),
                command.calculatedBookBalance.toString(),
                command.difference.toString(),
                command.finalizedAt.toEpochSeconds()
            );

            if (updated.affected_rows() != 1) {
                return false;
            }

            // Последняя сверка счёта, более ранняя дата выписки её не перезаписывает
            txn.exec_params(
                R"(
                    UPDATE business.bank_accounts a SET
                        last_reconciled_date = r.statement_date,
                        last_reconciled_balance = r.statement_ending_balance
                    FROM business.bank_reconciliations r
                    WHERE r.id = $1 AND a.id = r.bank_account_id
                      AND (a.last_reconciled_date IS NULL OR a.last_reconciled_date <= r.statement_date)
                )",
                command.reconciliationId
            );

            txn.commit();
            return true;
        });
    }

private:
    std::shared_ptr<PostgresConnection> db_;

    static std::string selectSql() {
        return R"(
            SELECT r.id, r.bank_account_id,
                   to_char(r.statement_date, 'YYYY-MM-DD') AS statement_date,
                   r.statement_ending_balance::text AS statement_ending_balance,
                   r.calculated_book_balance::text AS calculated_book_balance,
                   r.reconciled_difference::text AS reconciled_difference,
                   r.status, r.notes, r.created_by_user_id,
                   EXTRACT(EPOCH FROM r.created_at)::BIGINT AS created_at,
                   EXTRACT(EPOCH FROM r.finalized_at)::BIGINT AS finalized_at,
                   a.currency_code
            FROM business.bank_reconciliations r
            JOIN business.bank_accounts a ON a.id = r.bank_account_id
        )";
    }

    static domain::Reconciliation rowToReconciliation(const pqxx::row& row) {
        const std::string currency = row["currency_code"].as<std::string>();

        domain::Reconciliation rec;
        rec.id = row["id"].as<int64_t>();
        rec.bankAccountId = row["bank_account_id"].as<int64_t>();
        rec.statementDate = domain::Date::fromString(row["statement_date"].as<std::string>());
        rec.statementEndingBalance = domain::Money::fromString(
            row["statement_ending_balance"].as<std::string>(), currency);
        if (!row["calculated_book_balance"].is_null()) {
            rec.calculatedBookBalance = domain::Money::fromString(
                row["calculated_book_balance"].as<std::string>(), currency);
        }
        if (!row["reconciled_difference"].is_null()) {
            rec.difference = domain::Money::fromString(
                row["reconciled_difference"].as<std::string>(), currency);
        }
        rec.status = domain::parseReconciliationStatus(row["status"].as<std::string>());
        rec.notes = row["notes"].is_null() ? "" : row["notes"].as<std::string>();
        rec.createdBy = row["created_by_user_id"].as<int64_t>();
        rec.createdAt = domain::Timestamp::fromEpochSeconds(row["created_at"].as<int64_t>());
        if (!row["finalized_at"].is_null()) {
            rec.finalizedAt = domain::Timestamp::fromEpochSeconds(row["finalized_at"].as<int64_t>());
        }
        return rec;
    }
};

} // namespace reconciliation::adapters::secondary
