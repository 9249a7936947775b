#pragma once

#include "domain/ReconciliationSummary.hpp"
#include "domain/BankTransaction.hpp"

namespace reconciliation::application {

/**
 * @brief Классическое тождество сверки банковского счёта
 *
 * Чистая функция: остаток GL на дату выписки, остаток выписки и текущие
 * несверенные пулы -> скорректированные остатки и разница.
 *
 * Несверенные строки выписки:  > 0 -> interestNotInBook,  < 0 -> chargesNotInBook (модуль)
 * Несверенные операции учёта:  > 0 -> depositsInTransit,  < 0 -> outstandingWithdrawals (модуль)
 */
class BalanceCalculator {
public:
    static domain::ReconciliationSummary calculate(
        const domain::Money& glBalance,
        const domain::Money& statementEndingBalance,
        const domain::TransactionPartition& unreconciled)
    {
        domain::ReconciliationSummary s;
        const std::string& currency = statementEndingBalance.currency;

        s.glBalance = glBalance;
        s.statementEndingBalance = statementEndingBalance;
        s.interestNotInBook = domain::Money::zero(currency);
        s.chargesNotInBook = domain::Money::zero(currency);
        s.depositsInTransit = domain::Money::zero(currency);
        s.outstandingWithdrawals = domain::Money::zero(currency);

        for (const auto& txn : unreconciled.statementItems) {
            if (txn.isReconciled) continue;
            if (txn.amount.isPositive()) {
                s.interestNotInBook += txn.amount;
            } else if (txn.amount.isNegative()) {
                s.chargesNotInBook += txn.amount.abs();
            }
        }

        for (const auto& txn : unreconciled.systemItems) {
            if (txn.isReconciled) continue;
            if (txn.amount.isPositive()) {
                s.depositsInTransit += txn.amount;
            } else if (txn.amount.isNegative()) {
                s.outstandingWithdrawals += txn.amount.abs();
            }
        }

        s.adjustedBookBalance = glBalance + s.interestNotInBook - s.chargesNotInBook;
        s.adjustedBankBalance = statementEndingBalance + s.depositsInTransit - s.outstandingWithdrawals;
        s.difference = s.adjustedBankBalance - s.adjustedBookBalance;
        return s;
    }
};

} // namespace reconciliation::application
