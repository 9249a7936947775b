#pragma once

#include "domain/Reconciliation.hpp"
#include "domain/BankTransaction.hpp"
#include "domain/Result.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace reconciliation::ports::input {

/**
 * @brief Запрос на открытие или продолжение черновика сверки
 */
struct DraftRequest {
    int64_t bankAccountId = 0;
    domain::Date statementDate;
    domain::Money statementEndingBalance;
    std::optional<std::string> notes;   ///< nullopt: заметки черновика не меняются
    int64_t actorId = 0;
};

/**
 * @brief Хранилище черновиков сверки: жизненный цикл записи Reconciliation
 */
class IReconciliationDraftService {
public:
    virtual ~IReconciliationDraftService() = default;

    /**
     * @brief Вернуть открытый черновик (счёт, дата выписки) или создать новый
     *
     * Для существующего черновика обновляет остаток выписки.
     * Не отказывает по бизнес-правилам, кроме неизвестного/неактивного счёта.
     */
    virtual domain::Result<domain::Reconciliation> getOrCreateDraft(const DraftRequest& request) = 0;

    /**
     * @brief Сверка по ID в любом статусе
     */
    virtual domain::Result<domain::Reconciliation> getReconciliation(int64_t reconciliationId) = 0;

    /**
     * @brief История финализированных сверок счёта, новые первыми
     */
    virtual domain::Result<domain::ReconciliationPage> listHistory(
        int64_t bankAccountId, int page, int pageSize) = 0;

    /**
     * @brief Операции, сопоставленные в рамках сверки
     */
    virtual domain::Result<domain::TransactionPartition> getItemsForReconciliation(
        int64_t reconciliationId) = 0;

    /**
     * @brief Несверенные кандидаты на дату выписки черновика
     */
    virtual domain::Result<domain::TransactionPartition> getUnreconciledPool(
        int64_t reconciliationId) = 0;
};

} // namespace reconciliation::ports::input
