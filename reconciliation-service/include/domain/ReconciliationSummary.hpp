#pragma once

#include "Money.hpp"

namespace reconciliation::domain {

/**
 * @brief Итоги расчёта сверки остатков
 *
 * adjustedBookBalance = glBalance + interestNotInBook - chargesNotInBook
 * adjustedBankBalance = statementEndingBalance + depositsInTransit - outstandingWithdrawals
 * difference          = adjustedBankBalance - adjustedBookBalance
 */
struct ReconciliationSummary {
    Money glBalance;
    Money statementEndingBalance;

    Money interestNotInBook;        ///< Поступления в выписке, не отражённые в учёте
    Money chargesNotInBook;         ///< Списания в выписке (модуль), не отражённые в учёте
    Money depositsInTransit;        ///< Поступления в учёте, ещё не в выписке
    Money outstandingWithdrawals;   ///< Списания в учёте (модуль), ещё не в выписке

    Money adjustedBookBalance;
    Money adjustedBankBalance;
    Money difference;

    bool canFinalize() const {
        return difference.isBelow(kTolerance);
    }
};

} // namespace reconciliation::domain
