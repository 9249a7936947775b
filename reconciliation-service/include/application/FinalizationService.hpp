#pragma once

#include "ports/input/IFinalizationService.hpp"
#include "ports/input/IBalanceSummaryService.hpp"
#include "ports/output/IReconciliationRepository.hpp"
#include <memory>
#include <iostream>

namespace reconciliation::application {

/**
 * @brief Контроллер финализации
 *
 * Порядок проверок: сверка существует -> ещё DRAFT -> переданная разница
 * меньше допуска -> разница, пересчитанная с подтверждённым остатком выписки,
 * тоже меньше допуска -> переданный учётный остаток совпадает с пересчитанным
 * с точностью до цента. Банковские операции не трогает: они закреплены при
 * сопоставлении.
 *
 * Пересчёт и условное обновление статуса идут в разных транзакциях хранилища:
 * unmatch, попавший между ними, не отменяет финализацию.
 * TODO: перенести проверку суммы закреплённых операций в ту же транзакцию,
 * что и IReconciliationRepository::finalize.
 */
class FinalizationService : public ports::input::IFinalizationService {
public:
    FinalizationService(
        std::shared_ptr<ports::output::IReconciliationRepository> reconciliations,
        std::shared_ptr<ports::input::IBalanceSummaryService> summaries
    ) : reconciliations_(std::move(reconciliations))
      , summaries_(std::move(summaries))
    {
        std::cout << "[FinalizationService] Created" << std::endl;
    }

    domain::Result<domain::Reconciliation> finalize(const ports::input::FinalizeRequest& request) override {
        using R = domain::Result<domain::Reconciliation>;
        using domain::ReconciliationError;

        try {
            auto rec = reconciliations_->findById(request.reconciliationId);
            if (!rec) {
                return R::failure(ReconciliationError::notFound(
                    "Reconciliation not found", request.reconciliationId));
            }
            if (rec->isFinalized()) {
                std::cout << "[FinalizationService] REJECTED: " << rec->id << " already finalized" << std::endl;
                return R::failure(ReconciliationError::alreadyFinalized(rec->id));
            }

            if (!request.difference.isBelow(domain::kTolerance)) {
                std::cout << "[FinalizationService] REJECTED: difference " << request.difference.toString()
                          << " for " << rec->id << std::endl;
                return R::failure(ReconciliationError::notBalanced(
                    "Difference " + request.difference.toString() + " is not within tolerance " +
                    domain::kTolerance.toString(), rec->id));
            }

            auto summary = summaries_->calculateSummary(rec->id, request.statementEndingBalance);
            if (!summary.ok()) {
                return R::failure(summary.error());
            }
            if (!summary.value().canFinalize()) {
                std::cout << "[FinalizationService] REJECTED: recomputed difference "
                          << summary.value().difference.toString() << " for " << rec->id << std::endl;
                return R::failure(ReconciliationError::notBalanced(
                    "Recomputed difference " + summary.value().difference.toString() +
                    " is not within tolerance " + domain::kTolerance.toString() +
                    "; reload the reconciliation", rec->id));
            }

            const auto& recomputedBook = summary.value().adjustedBookBalance;
            if (!(request.bookBalance - recomputedBook).isBelow(domain::kTolerance)) {
                std::cout << "[FinalizationService] REJECTED: book balance " << request.bookBalance.toString()
                          << " vs recomputed " << recomputedBook.toString() << " for " << rec->id << std::endl;
                return R::failure(ReconciliationError::notBalanced(
                    "Book balance " + request.bookBalance.toString() +
                    " does not match recomputed book balance " + recomputedBook.toString() +
                    "; reload the reconciliation", rec->id));
            }

            ports::output::FinalizeCommand command;
            command.reconciliationId = rec->id;
            command.statementEndingBalance = request.statementEndingBalance;
            command.calculatedBookBalance = request.bookBalance;
            command.difference = request.difference;
            command.finalizedAt = domain::Timestamp::now();

            if (!reconciliations_->finalize(command)) {
                return R::failure(ReconciliationError::alreadyFinalized(rec->id));
            }

            auto finalized = reconciliations_->findById(rec->id);
            if (!finalized) {
                return R::failure(ReconciliationError::notFound("Reconciliation not found", rec->id));
            }

            std::cout << "[FinalizationService] Finalized " << finalized->id
                      << " statement " << finalized->statementDate.toString()
                      << " balance " << request.statementEndingBalance.toString()
                      << " (actor " << request.actorId << ")" << std::endl;
            return R::success(*finalized);

        } catch (const domain::PersistenceError& e) {
            std::cerr << "[FinalizationService] finalize failed: " << e.what() << std::endl;
            return R::failure(ReconciliationError::persistence(e.what()));
        }
    }

private:
    std::shared_ptr<ports::output::IReconciliationRepository> reconciliations_;
    std::shared_ptr<ports::input::IBalanceSummaryService> summaries_;
};

} // namespace reconciliation::application
