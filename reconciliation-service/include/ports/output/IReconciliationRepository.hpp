#pragma once

#include "domain/Reconciliation.hpp"
#include <optional>
#include <cstdint>

namespace reconciliation::ports::output {

/**
 * @brief Данные финализации, которые пишутся в строку сверки
 */
struct FinalizeCommand {
    int64_t reconciliationId = 0;
    domain::Money statementEndingBalance;
    domain::Money calculatedBookBalance;
    domain::Money difference;
    domain::Timestamp finalizedAt;
};

/**
 * @brief Хранилище записей Reconciliation
 *
 * Каждая изменяющая операция выполняется одной транзакцией БД.
 * Ошибки хранилища: domain::PersistenceError.
 */
class IReconciliationRepository {
public:
    virtual ~IReconciliationRepository() = default;

    /**
     * @brief Найти открытый черновик по (счёт, дата выписки) или создать новый
     *
     * Атомарный upsert: для существующего черновика обновляется остаток выписки
     * (и заметки, если переданы), дубликат черновика не создаётся.
     */
    virtual domain::Reconciliation getOrCreateDraft(
        int64_t bankAccountId,
        const domain::Date& statementDate,
        const domain::Money& statementEndingBalance,
        const std::optional<std::string>& notes,
        int64_t actorId) = 0;

    virtual std::optional<domain::Reconciliation> findById(int64_t reconciliationId) = 0;

    /**
     * @brief Страница финализированных сверок счёта, новые даты выписки первыми
     */
    virtual domain::ReconciliationPage findFinalized(
        int64_t bankAccountId, int page, int pageSize) = 0;

    /**
     * @brief Перевести черновик в FINALIZED
     * @return false если запись не в статусе DRAFT (ничего не изменено)
     */
    virtual bool finalize(const FinalizeCommand& command) = 0;
};

} // namespace reconciliation::ports::output
