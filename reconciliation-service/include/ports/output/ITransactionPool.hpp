#pragma once

#include "domain/BankTransaction.hpp"
#include <vector>
#include <cstdint>

namespace reconciliation::ports::output {

/**
 * @brief Доступ к банковским операциям для сверки
 *
 * claim/release остаются единственным путём изменения флагов сверки.
 * Оба метода атомарны: либо применяются ко всем id, либо ни к одному.
 */
class ITransactionPool {
public:
    virtual ~ITransactionPool() = default;

    /**
     * @brief Несверенные операции счёта с датой не позже asOfDate
     */
    virtual domain::TransactionPartition getUnreconciled(
        int64_t bankAccountId, const domain::Date& asOfDate) = 0;

    /**
     * @brief Операции, закреплённые за сверкой
     */
    virtual domain::TransactionPartition getItemsForReconciliation(int64_t reconciliationId) = 0;

    /**
     * @brief Прочитать операции по id (отсутствующие id пропускаются)
     */
    virtual std::vector<domain::BankTransaction> findByIds(const std::vector<int64_t>& ids) = 0;

    /**
     * @brief Закрепить операции за черновиком сверки
     *
     * В одной транзакции проверяет, что каждая операция существует, принадлежит
     * bankAccountId и не сверена, а сверка всё ещё DRAFT; затем выставляет
     * is_reconciled, reconciliation_id, reconciled_date = statementDate.
     *
     * @return false если проверка не прошла на момент коммита (ничего не изменено)
     */
    virtual bool claim(int64_t reconciliationId,
                       int64_t bankAccountId,
                       const std::vector<int64_t>& ids,
                       const domain::Date& statementDate) = 0;

    /**
     * @brief Снять закрепление
     *
     * В одной транзакции проверяет, что каждая операция сверена черновиком
     * (не FINALIZED), и сбрасывает три поля сверки.
     *
     * @return false если проверка не прошла (ничего не изменено)
     */
    virtual bool release(const std::vector<int64_t>& ids) = 0;
};

} // namespace reconciliation::ports::output
