#pragma once

#include "ports/input/IReconciliationDraftService.hpp"
#include "ports/output/IReconciliationRepository.hpp"
#include "ports/output/ITransactionPool.hpp"
#include "ports/output/IBankAccountDirectory.hpp"
#include <memory>
#include <iostream>

namespace reconciliation::application {

/**
 * @brief Хранилище черновиков сверки
 *
 * Открытие сессии сверки всегда переиспользует существующий черновик
 * (счёт, дата выписки); уникальность обеспечивает атомарный upsert репозитория,
 * поэтому две одновременные сессии получают один и тот же id.
 */
class ReconciliationDraftService : public ports::input::IReconciliationDraftService {
public:
    static constexpr int kMaxPageSize = 200;

    ReconciliationDraftService(
        std::shared_ptr<ports::output::IReconciliationRepository> reconciliations,
        std::shared_ptr<ports::output::ITransactionPool> pool,
        std::shared_ptr<ports::output::IBankAccountDirectory> bankAccounts
    ) : reconciliations_(std::move(reconciliations))
      , pool_(std::move(pool))
      , bankAccounts_(std::move(bankAccounts))
    {
        std::cout << "[ReconciliationDraftService] Created" << std::endl;
    }

    domain::Result<domain::Reconciliation> getOrCreateDraft(
        const ports::input::DraftRequest& request) override
    {
        using R = domain::Result<domain::Reconciliation>;

        try {
            auto account = bankAccounts_->getById(request.bankAccountId);
            if (!account) {
                return R::failure(domain::ReconciliationError::notFound(
                    "Bank account not found", request.bankAccountId));
            }
            if (!account->isActive) {
                return R::failure(domain::ReconciliationError::validation(
                    "Bank account '" + account->name + "' is not active", request.bankAccountId));
            }

            domain::Money balance = request.statementEndingBalance;
            balance.currency = account->currencyCode;

            auto draft = reconciliations_->getOrCreateDraft(
                request.bankAccountId,
                request.statementDate,
                balance,
                request.notes,
                request.actorId);

            std::cout << "[ReconciliationDraftService] Draft " << draft.id
                      << " for account " << draft.bankAccountId
                      << " statement " << draft.statementDate.toString()
                      << " balance " << draft.statementEndingBalance.toString() << std::endl;

            return R::success(draft);

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[ReconciliationDraftService] getOrCreateDraft failed: " << e.what() << std::endl;
            return R::failure(domain::ReconciliationError::persistence(e.what()));
        }
    }

    domain::Result<domain::Reconciliation> getReconciliation(int64_t reconciliationId) override {
        using R = domain::Result<domain::Reconciliation>;

        try {
            auto rec = reconciliations_->findById(reconciliationId);
            if (!rec) {
                return R::failure(domain::ReconciliationError::notFound(
                    "Reconciliation not found", reconciliationId));
            }
            return R::success(*rec);

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[ReconciliationDraftService] getReconciliation failed: " << e.what() << std::endl;
            return R::failure(domain::ReconciliationError::persistence(e.what()));
        }
    }

    domain::Result<domain::ReconciliationPage> listHistory(
        int64_t bankAccountId, int page, int pageSize) override
    {
        using R = domain::Result<domain::ReconciliationPage>;

        if (page < 1) {
            return R::failure(domain::ReconciliationError::validation("page must be >= 1"));
        }
        if (pageSize < 1 || pageSize > kMaxPageSize) {
            return R::failure(domain::ReconciliationError::validation(
                "page_size must be between 1 and " + std::to_string(kMaxPageSize)));
        }

        try {
            return R::success(reconciliations_->findFinalized(bankAccountId, page, pageSize));
        } catch (const domain::PersistenceError& e) {
            std::cerr << "[ReconciliationDraftService] listHistory failed: " << e.what() << std::endl;
            return R::failure(domain::ReconciliationError::persistence(e.what()));
        }
    }

    domain::Result<domain::TransactionPartition> getItemsForReconciliation(
        int64_t reconciliationId) override
    {
        using R = domain::Result<domain::TransactionPartition>;

        try {
            if (!reconciliations_->findById(reconciliationId)) {
                return R::failure(domain::ReconciliationError::notFound(
                    "Reconciliation not found", reconciliationId));
            }
            return R::success(pool_->getItemsForReconciliation(reconciliationId));

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[ReconciliationDraftService] getItemsForReconciliation failed: " << e.what() << std::endl;
            return R::failure(domain::ReconciliationError::persistence(e.what()));
        }
    }

    domain::Result<domain::TransactionPartition> getUnreconciledPool(int64_t reconciliationId) override {
        using R = domain::Result<domain::TransactionPartition>;

        try {
            auto rec = reconciliations_->findById(reconciliationId);
            if (!rec) {
                return R::failure(domain::ReconciliationError::notFound(
                    "Reconciliation not found", reconciliationId));
            }
            return R::success(pool_->getUnreconciled(rec->bankAccountId, rec->statementDate));

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[ReconciliationDraftService] getUnreconciledPool failed: " << e.what() << std::endl;
            return R::failure(domain::ReconciliationError::persistence(e.what()));
        }
    }

private:
    std::shared_ptr<ports::output::IReconciliationRepository> reconciliations_;
    std::shared_ptr<ports::output::ITransactionPool> pool_;
    std::shared_ptr<ports::output::IBankAccountDirectory> bankAccounts_;
};

} // namespace reconciliation::application
