#pragma once

#include "ports/input/IMatchingService.hpp"
#include "ports/output/IReconciliationRepository.hpp"
#include "ports/output/ITransactionPool.hpp"
#include "ports/output/IBankAccountDirectory.hpp"
#include <memory>
#include <iostream>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace reconciliation::application {

/**
 * @brief Механизм сопоставления операций выписки и учёта
 *
 * Состояния операции: Unreconciled -> ProvisionallyMatched (черновик) -> Finalized,
 * обратный переход ProvisionallyMatched -> Unreconciled только пока сверка DRAFT.
 *
 * Проверки выполняются до записи; сама запись (claim/release) повторно проверяет
 * условия внутри транзакции, поэтому гонка двух сессий за одну операцию
 * заканчивается отказом второй, а не частичным применением.
 */
class MatchingService : public ports::input::IMatchingService {
public:
    MatchingService(
        std::shared_ptr<ports::output::IReconciliationRepository> reconciliations,
        std::shared_ptr<ports::output::ITransactionPool> pool,
        std::shared_ptr<ports::output::IBankAccountDirectory> bankAccounts
    ) : reconciliations_(std::move(reconciliations))
      , pool_(std::move(pool))
      , bankAccounts_(std::move(bankAccounts))
    {
        std::cout << "[MatchingService] Created" << std::endl;
    }

    domain::Result<ports::input::MatchOutcome> match(const ports::input::MatchRequest& request) override {
        using R = domain::Result<ports::input::MatchOutcome>;
        using domain::ReconciliationError;

        if (request.statementTransactionIds.empty() || request.systemTransactionIds.empty()) {
            return R::failure(ReconciliationError::validation(
                "Select items from both statement and system transactions to match"));
        }

        std::vector<int64_t> allIds;
        allIds.reserve(request.statementTransactionIds.size() + request.systemTransactionIds.size());
        allIds.insert(allIds.end(), request.statementTransactionIds.begin(), request.statementTransactionIds.end());
        allIds.insert(allIds.end(), request.systemTransactionIds.begin(), request.systemTransactionIds.end());

        if (auto dup = findDuplicate(allIds)) {
            return R::failure(ReconciliationError::validation(
                "Transaction " + std::to_string(*dup) + " is selected more than once", *dup));
        }

        try {
            auto draft = reconciliations_->findById(request.reconciliationId);
            if (!draft) {
                return R::failure(ReconciliationError::notFound(
                    "Reconciliation not found", request.reconciliationId));
            }
            if (draft->isFinalized()) {
                return R::failure(ReconciliationError::immutable(
                    "Reconciliation " + std::to_string(draft->id) + " is finalized", draft->id));
            }
            if (request.statementDate != draft->statementDate) {
                return R::failure(ReconciliationError::validation(
                    "Statement date " + request.statementDate.toString() +
                    " does not match draft statement date " + draft->statementDate.toString(),
                    draft->id));
            }

            auto account = bankAccounts_->getById(draft->bankAccountId);
            if (!account) {
                return R::failure(ReconciliationError::notFound(
                    "Bank account not found", draft->bankAccountId));
            }
            if (!account->isActive) {
                return R::failure(ReconciliationError::validation(
                    "Bank account '" + account->name + "' is not active", account->id));
            }

            auto rows = pool_->findByIds(allIds);
            std::unordered_map<int64_t, domain::BankTransaction> byId;
            for (auto& row : rows) {
                byId.emplace(row.id, std::move(row));
            }

            domain::Money statementSum = domain::Money::zero(account->currencyCode);
            domain::Money systemSum = domain::Money::zero(account->currencyCode);

            for (int64_t id : request.statementTransactionIds) {
                auto error = checkCandidate(byId, id, *draft, true);
                if (error) return R::failure(*error);
                statementSum += byId.at(id).amount;
            }
            for (int64_t id : request.systemTransactionIds) {
                auto error = checkCandidate(byId, id, *draft, false);
                if (error) return R::failure(*error);
                systemSum += byId.at(id).amount;
            }

            if (!statementSum.isWithin(systemSum, domain::kTolerance)) {
                std::cout << "[MatchingService] REJECTED: statement " << statementSum.toString()
                          << " vs system " << systemSum.toString() << std::endl;
                return R::failure(ReconciliationError::unbalanced(statementSum, systemSum));
            }

            if (!pool_->claim(draft->id, draft->bankAccountId, allIds, draft->statementDate)) {
                // Условия изменились между проверкой и записью
                auto current = reconciliations_->findById(draft->id);
                if (current && current->isFinalized()) {
                    return R::failure(ReconciliationError::immutable(
                        "Reconciliation " + std::to_string(draft->id) + " was finalized", draft->id));
                }
                std::cout << "[MatchingService] REJECTED: selection changed concurrently for draft "
                          << draft->id << std::endl;
                return R::failure(ReconciliationError::validation(
                    "One or more selected transactions are no longer unreconciled", draft->id));
            }

            std::cout << "[MatchingService] Matched " << request.statementTransactionIds.size()
                      << " statement / " << request.systemTransactionIds.size()
                      << " system items under draft " << draft->id
                      << " (total " << statementSum.toString() << ", actor "
                      << request.actorId << ")" << std::endl;

            ports::input::MatchOutcome outcome;
            outcome.statementSum = statementSum;
            outcome.systemSum = systemSum;
            outcome.matchedCount = allIds.size();
            return R::success(outcome);

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[MatchingService] match failed: " << e.what() << std::endl;
            return R::failure(ReconciliationError::persistence(e.what()));
        }
    }

    domain::Result<std::size_t> unmatch(const std::vector<int64_t>& transactionIds, int64_t actorId) override {
        using R = domain::Result<std::size_t>;
        using domain::ReconciliationError;

        if (transactionIds.empty()) {
            return R::failure(ReconciliationError::validation("No transactions selected to unmatch"));
        }
        if (auto dup = findDuplicate(transactionIds)) {
            return R::failure(ReconciliationError::validation(
                "Transaction " + std::to_string(*dup) + " is selected more than once", *dup));
        }

        try {
            auto rows = pool_->findByIds(transactionIds);
            std::unordered_map<int64_t, domain::BankTransaction> byId;
            for (auto& row : rows) {
                byId.emplace(row.id, std::move(row));
            }

            std::unordered_map<int64_t, domain::Reconciliation> owners;
            for (int64_t id : transactionIds) {
                auto it = byId.find(id);
                if (it == byId.end()) {
                    return R::failure(ReconciliationError::notFound("Bank transaction not found", id));
                }
                const auto& txn = it->second;
                if (!txn.isReconciled || !txn.reconciliationId) {
                    return R::failure(ReconciliationError::validation(
                        "Bank transaction " + std::to_string(id) + " is not reconciled", id));
                }

                int64_t ownerId = *txn.reconciliationId;
                auto owner = owners.find(ownerId);
                if (owner == owners.end()) {
                    auto rec = reconciliations_->findById(ownerId);
                    if (!rec) {
                        return R::failure(ReconciliationError::notFound("Reconciliation not found", ownerId));
                    }
                    owner = owners.emplace(ownerId, *rec).first;
                }
                if (owner->second.isFinalized()) {
                    return R::failure(ReconciliationError::immutable(
                        "Bank transaction " + std::to_string(id) +
                        " belongs to finalized reconciliation " + std::to_string(ownerId), id));
                }
            }

            if (!pool_->release(transactionIds)) {
                std::cout << "[MatchingService] REJECTED: unmatch raced with finalization or another session"
                          << std::endl;
                for (const auto& [ownerId, rec] : owners) {
                    auto current = reconciliations_->findById(ownerId);
                    if (current && current->isFinalized()) {
                        return R::failure(ReconciliationError::immutable(
                            "Reconciliation " + std::to_string(ownerId) + " was finalized", ownerId));
                    }
                }
                return R::failure(ReconciliationError::validation(
                    "One or more selected transactions are no longer reconciled"));
            }

            std::cout << "[MatchingService] Unmatched " << transactionIds.size()
                      << " items (actor " << actorId << ")" << std::endl;
            return R::success(transactionIds.size());

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[MatchingService] unmatch failed: " << e.what() << std::endl;
            return R::failure(ReconciliationError::persistence(e.what()));
        }
    }

private:
    std::shared_ptr<ports::output::IReconciliationRepository> reconciliations_;
    std::shared_ptr<ports::output::ITransactionPool> pool_;
    std::shared_ptr<ports::output::IBankAccountDirectory> bankAccounts_;

    static std::optional<int64_t> findDuplicate(const std::vector<int64_t>& ids) {
        std::unordered_set<int64_t> seen;
        for (int64_t id : ids) {
            if (!seen.insert(id).second) return id;
        }
        return std::nullopt;
    }

    static std::optional<domain::ReconciliationError> checkCandidate(
        const std::unordered_map<int64_t, domain::BankTransaction>& byId,
        int64_t id,
        const domain::Reconciliation& draft,
        bool statementSide)
    {
        using domain::ReconciliationError;

        auto it = byId.find(id);
        if (it == byId.end()) {
            return ReconciliationError::notFound("Bank transaction not found", id);
        }
        const auto& txn = it->second;
        const std::string label = "Bank transaction " + std::to_string(id);

        if (txn.bankAccountId != draft.bankAccountId) {
            return ReconciliationError::validation(label + " belongs to another bank account", id);
        }
        if (txn.isReconciled) {
            return ReconciliationError::validation(label + " is already reconciled", id);
        }
        if (txn.isFromStatement != statementSide) {
            return ReconciliationError::validation(
                label + (statementSide ? " is not a statement item" : " is not a system transaction"), id);
        }
        if (txn.transactionDate > draft.statementDate) {
            return ReconciliationError::validation(label + " is dated after the statement date", id);
        }
        return std::nullopt;
    }
};

} // namespace reconciliation::application
