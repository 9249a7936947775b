#pragma once

#include "domain/ReconciliationSummary.hpp"
#include "domain/Result.hpp"
#include <optional>
#include <cstdint>

namespace reconciliation::ports::input {

/**
 * @brief Расчёт скорректированных остатков банка и учёта
 *
 * Каждый вызов заново читает остаток GL и несверенные пулы, ничего не кэширует.
 */
class IBalanceSummaryService {
public:
    virtual ~IBalanceSummaryService() = default;

    /**
     * @param statementEndingBalance остаток выписки для расчёта;
     *        nullopt: остаток, сохранённый в сверке
     */
    virtual domain::Result<domain::ReconciliationSummary> calculateSummary(
        int64_t reconciliationId,
        const std::optional<domain::Money>& statementEndingBalance = std::nullopt) = 0;
};

} // namespace reconciliation::ports::input
