#pragma once

#include "ports/input/IBalanceSummaryService.hpp"
#include "ports/output/IReconciliationRepository.hpp"
#include "ports/output/ITransactionPool.hpp"
#include "ports/output/IBalanceOracle.hpp"
#include "ports/output/IBankAccountDirectory.hpp"
#include "application/BalanceCalculator.hpp"
#include <memory>
#include <iostream>

namespace reconciliation::application {

/**
 * @brief Расчёт итогов сверки поверх BalanceCalculator
 *
 * Собирает входы калькулятора из хранилища: остаток GL банковского счёта
 * на дату выписки и несверенные пулы на ту же дату.
 */
class BalanceSummaryService : public ports::input::IBalanceSummaryService {
public:
    BalanceSummaryService(
        std::shared_ptr<ports::output::IReconciliationRepository> reconciliations,
        std::shared_ptr<ports::output::ITransactionPool> pool,
        std::shared_ptr<ports::output::IBalanceOracle> balanceOracle,
        std::shared_ptr<ports::output::IBankAccountDirectory> bankAccounts
    ) : reconciliations_(std::move(reconciliations))
      , pool_(std::move(pool))
      , balanceOracle_(std::move(balanceOracle))
      , bankAccounts_(std::move(bankAccounts))
    {
        std::cout << "[BalanceSummaryService] Created" << std::endl;
    }

    domain::Result<domain::ReconciliationSummary> calculateSummary(
        int64_t reconciliationId,
        const std::optional<domain::Money>& statementEndingBalance) override
    {
        using R = domain::Result<domain::ReconciliationSummary>;
        using domain::ReconciliationError;

        try {
            auto rec = reconciliations_->findById(reconciliationId);
            if (!rec) {
                return R::failure(ReconciliationError::notFound("Reconciliation not found", reconciliationId));
            }

            auto account = bankAccounts_->getById(rec->bankAccountId);
            if (!account) {
                return R::failure(ReconciliationError::notFound("Bank account not found", rec->bankAccountId));
            }
            if (account->glAccountId == 0) {
                return R::failure(ReconciliationError::validation(
                    "Bank account '" + account->name + "' has no GL account link", account->id));
            }

            domain::Money glBalance = balanceOracle_->getAccountBalance(account->glAccountId, rec->statementDate);
            glBalance.currency = account->currencyCode;

            domain::Money statementBalance = statementEndingBalance.value_or(rec->statementEndingBalance);
            statementBalance.currency = account->currencyCode;

            auto unreconciled = pool_->getUnreconciled(rec->bankAccountId, rec->statementDate);

            auto summary = BalanceCalculator::calculate(glBalance, statementBalance, unreconciled);
            return R::success(summary);

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[BalanceSummaryService] calculateSummary failed: " << e.what() << std::endl;
            return R::failure(ReconciliationError::persistence(e.what()));
        }
    }

private:
    std::shared_ptr<ports::output::IReconciliationRepository> reconciliations_;
    std::shared_ptr<ports::output::ITransactionPool> pool_;
    std::shared_ptr<ports::output::IBalanceOracle> balanceOracle_;
    std::shared_ptr<ports::output::IBankAccountDirectory> bankAccounts_;
};

} // namespace reconciliation::application
