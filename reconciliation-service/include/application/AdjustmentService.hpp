#pragma once

#include "ports/input/IAdjustmentService.hpp"
#include "ports/output/IReconciliationRepository.hpp"
#include "ports/output/ITransactionPool.hpp"
#include "ports/output/IBankAccountDirectory.hpp"
#include "ports/output/IJournalEntryFactory.hpp"
#include <memory>
#include <string>
#include <iostream>

namespace reconciliation::application {

/**
 * @brief Проводка для строки выписки, которой нет в учёте
 *
 * Поступление (проценты): Дт банковский GL / Кт contra.
 * Списание (комиссия):    Дт contra / Кт банковский GL.
 * После проведения в пуле появляется системная операция, которую затем
 * сопоставляют со строкой выписки обычным match.
 */
class AdjustmentService : public ports::input::IAdjustmentService {
public:
    AdjustmentService(
        std::shared_ptr<ports::output::IReconciliationRepository> reconciliations,
        std::shared_ptr<ports::output::ITransactionPool> pool,
        std::shared_ptr<ports::output::IBankAccountDirectory> bankAccounts,
        std::shared_ptr<ports::output::IJournalEntryFactory> journal
    ) : reconciliations_(std::move(reconciliations))
      , pool_(std::move(pool))
      , bankAccounts_(std::move(bankAccounts))
      , journal_(std::move(journal))
    {
        std::cout << "[AdjustmentService] Created" << std::endl;
    }

    domain::Result<int64_t> bookStatementItem(const ports::input::AdjustmentRequest& request) override {
        using R = domain::Result<int64_t>;
        using domain::ReconciliationError;

        if (request.contraGlAccountId <= 0) {
            return R::failure(ReconciliationError::validation("contra_gl_account_id is required"));
        }

        try {
            auto rec = reconciliations_->findById(request.reconciliationId);
            if (!rec) {
                return R::failure(ReconciliationError::notFound(
                    "Reconciliation not found", request.reconciliationId));
            }
            if (rec->isFinalized()) {
                return R::failure(ReconciliationError::immutable(
                    "Reconciliation " + std::to_string(rec->id) + " is finalized", rec->id));
            }

            auto account = bankAccounts_->getById(rec->bankAccountId);
            if (!account) {
                return R::failure(ReconciliationError::notFound("Bank account not found", rec->bankAccountId));
            }
            if (account->glAccountId == 0) {
                return R::failure(ReconciliationError::validation(
                    "Bank account '" + account->name + "' has no GL account link", account->id));
            }
            if (account->glAccountId == request.contraGlAccountId) {
                return R::failure(ReconciliationError::validation(
                    "Contra account must differ from the bank GL account", request.contraGlAccountId));
            }

            auto rows = pool_->findByIds({request.statementTransactionId});
            if (rows.empty()) {
                return R::failure(ReconciliationError::notFound(
                    "Bank transaction not found", request.statementTransactionId));
            }
            const auto& item = rows.front();
            const std::string label = "Bank transaction " + std::to_string(item.id);

            if (item.bankAccountId != rec->bankAccountId) {
                return R::failure(ReconciliationError::validation(label + " belongs to another bank account", item.id));
            }
            if (!item.isFromStatement) {
                return R::failure(ReconciliationError::validation(label + " is not a statement item", item.id));
            }
            if (item.isReconciled) {
                return R::failure(ReconciliationError::validation(label + " is already reconciled", item.id));
            }
            if (item.amount.isZero()) {
                return R::failure(ReconciliationError::validation(label + " has a zero amount", item.id));
            }

            auto entry = buildEntry(item, *account, request);
            int64_t journalEntryId = journal_->createAndPost(entry);

            std::cout << "[AdjustmentService] Journal entry " << journalEntryId
                      << " booked for statement item " << item.id
                      << " amount " << item.amount.toString() << std::endl;
            return R::success(journalEntryId);

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[AdjustmentService] bookStatementItem failed: " << e.what() << std::endl;
            return R::failure(ReconciliationError::persistence(e.what()));
        }
    }

private:
    std::shared_ptr<ports::output::IReconciliationRepository> reconciliations_;
    std::shared_ptr<ports::output::ITransactionPool> pool_;
    std::shared_ptr<ports::output::IBankAccountDirectory> bankAccounts_;
    std::shared_ptr<ports::output::IJournalEntryFactory> journal_;

    /**
     * @brief Первые maxChars символов UTF-8 строки, без разрыва многобайтового символа
     */
    static std::string truncateChars(const std::string& text, size_t maxChars) {
        size_t chars = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            // Байты продолжения 10xxxxxx не начинают новый символ
            if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
                if (chars == maxChars) {
                    return text.substr(0, i);
                }
                ++chars;
            }
        }
        return text;
    }

    static domain::JournalEntryRequest buildEntry(
        const domain::BankTransaction& item,
        const domain::BankAccount& account,
        const ports::input::AdjustmentRequest& request)
    {
        const domain::Money amount = item.amount.abs();
        const domain::Money zero = domain::Money::zero(account.currencyCode);
        const std::string lineDescription = "Bank Rec: " + truncateChars(item.description, 100);

        domain::JournalLine bankLine;
        bankLine.glAccountId = account.glAccountId;
        bankLine.description = lineDescription;
        bankLine.currencyCode = account.currencyCode;

        domain::JournalLine contraLine;
        contraLine.glAccountId = request.contraGlAccountId;
        contraLine.description = lineDescription;
        contraLine.currencyCode = account.currencyCode;

        if (item.amount.isPositive()) {
            bankLine.debit = amount;
            bankLine.credit = zero;
            contraLine.debit = zero;
            contraLine.credit = amount;
        } else {
            bankLine.debit = zero;
            bankLine.credit = amount;
            contraLine.debit = amount;
            contraLine.credit = zero;
        }

        domain::JournalEntryRequest entry;
        entry.entryDate = item.transactionDate;
        entry.description = "Entry for statement item: " + truncateChars(item.description, 150);
        entry.reference = item.reference;
        entry.actorId = request.actorId;
        entry.lines = {bankLine, contraLine};
        return entry;
    }
};

} // namespace reconciliation::application
