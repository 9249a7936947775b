#pragma once

#include <IResponse.hpp>
#include "domain/Reconciliation.hpp"
#include "domain/BankTransaction.hpp"
#include "domain/ReconciliationSummary.hpp"
#include "domain/ReconciliationError.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace reconciliation::adapters::primary {

/**
 * @brief Общая JSON-сериализация ответов и разбор тел запросов
 *
 * Суммы передаются десятичными строками ("800.00"), даты: YYYY-MM-DD.
 * Ошибки разбора полей: std::invalid_argument (ответ 400 VALIDATION).
 */
class JsonMapper {
public:
    /// Целая часть суммы ограничена 15 цифрами, как в Money::fromString
    static constexpr int64_t kMaxWholeUnits = 1000000000000000;

    static nlohmann::json toJson(const domain::Reconciliation& rec) {
        nlohmann::json j;
        j["id"] = rec.id;
        j["bank_account_id"] = rec.bankAccountId;
        j["statement_date"] = rec.statementDate.toString();
        j["statement_ending_balance"] = rec.statementEndingBalance.toString();
        j["calculated_book_balance"] = rec.calculatedBookBalance
            ? nlohmann::json(rec.calculatedBookBalance->toString()) : nlohmann::json(nullptr);
        j["reconciled_difference"] = rec.difference
            ? nlohmann::json(rec.difference->toString()) : nlohmann::json(nullptr);
        j["currency"] = rec.statementEndingBalance.currency;
        j["status"] = domain::toString(rec.status);
        j["notes"] = rec.notes;
        j["created_by"] = rec.createdBy;
        j["created_at"] = rec.createdAt.toString();
        j["finalized_at"] = rec.finalizedAt
            ? nlohmann::json(rec.finalizedAt->toString()) : nlohmann::json(nullptr);
        return j;
    }

    static nlohmann::json toJson(const domain::BankTransaction& txn) {
        nlohmann::json j;
        j["id"] = txn.id;
        j["bank_account_id"] = txn.bankAccountId;
        j["transaction_date"] = txn.transactionDate.toString();
        j["amount"] = txn.amount.toString();
        j["description"] = txn.description;
        j["reference"] = txn.reference;
        j["transaction_type"] = domain::toString(txn.type);
        j["is_from_statement"] = txn.isFromStatement;
        j["is_reconciled"] = txn.isReconciled;
        j["reconciled_date"] = txn.reconciledDate
            ? nlohmann::json(txn.reconciledDate->toString()) : nlohmann::json(nullptr);
        j["reconciliation_id"] = txn.reconciliationId
            ? nlohmann::json(*txn.reconciliationId) : nlohmann::json(nullptr);
        return j;
    }

    static nlohmann::json toJson(const domain::TransactionPartition& partition) {
        nlohmann::json statement = nlohmann::json::array();
        for (const auto& txn : partition.statementItems) {
            statement.push_back(toJson(txn));
        }
        nlohmann::json system = nlohmann::json::array();
        for (const auto& txn : partition.systemItems) {
            system.push_back(toJson(txn));
        }
        return {{"statement_items", statement}, {"system_items", system}};
    }

    static nlohmann::json toJson(const domain::ReconciliationSummary& s) {
        nlohmann::json j;
        j["gl_balance"] = s.glBalance.toString();
        j["statement_ending_balance"] = s.statementEndingBalance.toString();
        j["interest_not_in_book"] = s.interestNotInBook.toString();
        j["charges_not_in_book"] = s.chargesNotInBook.toString();
        j["deposits_in_transit"] = s.depositsInTransit.toString();
        j["outstanding_withdrawals"] = s.outstandingWithdrawals.toString();
        j["adjusted_book_balance"] = s.adjustedBookBalance.toString();
        j["adjusted_bank_balance"] = s.adjustedBankBalance.toString();
        j["difference"] = s.difference.toString();
        j["can_finalize"] = s.canFinalize();
        return j;
    }

    /**
     * @brief HTTP статус для вида ошибки
     */
    static int httpStatus(domain::ErrorKind kind) {
        switch (kind) {
            case domain::ErrorKind::VALIDATION:           return 400;
            case domain::ErrorKind::NOT_FOUND:            return 404;
            case domain::ErrorKind::UNBALANCED_SELECTION: return 422;
            case domain::ErrorKind::NOT_BALANCED:         return 422;
            case domain::ErrorKind::IMMUTABLE_RECORD:     return 409;
            case domain::ErrorKind::ALREADY_FINALIZED:    return 409;
            case domain::ErrorKind::PERSISTENCE:          return 503;
            default: return 500;
        }
    }

    static void sendFailure(IResponse& res, const domain::ReconciliationError& error) {
        nlohmann::json j;
        j["error"] = domain::toString(error.kind);
        j["message"] = error.message;
        if (error.statementSum) j["statement_sum"] = error.statementSum->toString();
        if (error.systemSum) j["system_sum"] = error.systemSum->toString();
        if (error.tolerance) j["tolerance"] = error.tolerance->toString();
        if (error.recordId) j["record_id"] = *error.recordId;
        res.setResult(httpStatus(error.kind), "application/json", j.dump());
    }

    static void sendError(IResponse& res, int status, const std::string& kind, const std::string& message) {
        nlohmann::json j;
        j["error"] = kind;
        j["message"] = message;
        res.setResult(status, "application/json", j.dump());
    }

    static void sendValidation(IResponse& res, const std::string& message) {
        sendError(res, 400, domain::toString(domain::ErrorKind::VALIDATION), message);
    }

    static void sendJson(IResponse& res, int status, const nlohmann::json& body) {
        res.setResult(status, "application/json", body.dump());
    }

    /**
     * @brief Сумма из поля: строка "800.00" или число
     */
    static domain::Money readMoney(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key) || body[key].is_null()) {
            throw std::invalid_argument(key + " is required");
        }
        const auto& value = body[key];
        if (value.is_string()) {
            return domain::Money::fromString(value.get<std::string>());
        }
        if (value.is_number_unsigned()) {
            auto units = value.get<uint64_t>();
            if (units >= static_cast<uint64_t>(kMaxWholeUnits)) {
                throw std::invalid_argument(key + " is out of range");
            }
            return domain::Money(static_cast<int64_t>(units), 0);
        }
        if (value.is_number_integer()) {
            auto units = value.get<int64_t>();
            if (units <= -kMaxWholeUnits) {
                throw std::invalid_argument(key + " is out of range");
            }
            return domain::Money(units, 0);
        }
        if (value.is_number_float()) {
            return domain::Money::fromDouble(value.get<double>());
        }
        throw std::invalid_argument(key + " must be a decimal amount");
    }

    static domain::Date readDate(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key) || !body[key].is_string()) {
            throw std::invalid_argument(key + " is required (YYYY-MM-DD)");
        }
        return domain::Date::fromString(body[key].get<std::string>());
    }

    static int64_t readId(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key) || !body[key].is_number_integer()) {
            throw std::invalid_argument(key + " is required");
        }
        int64_t id = body[key].get<int64_t>();
        if (id <= 0) {
            throw std::invalid_argument(key + " must be positive");
        }
        return id;
    }

    static std::vector<int64_t> readIds(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key)) {
            return {};
        }
        if (!body[key].is_array()) {
            throw std::invalid_argument(key + " must be an array of ids");
        }
        std::vector<int64_t> ids;
        for (const auto& item : body[key]) {
            if (!item.is_number_integer()) {
                throw std::invalid_argument(key + " must contain integer ids");
            }
            ids.push_back(item.get<int64_t>());
        }
        return ids;
    }
};

} // namespace reconciliation::adapters::primary
