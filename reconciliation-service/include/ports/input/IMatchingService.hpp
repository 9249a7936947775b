#pragma once

#include "domain/Result.hpp"
#include "domain/Date.hpp"
#include <vector>
#include <cstddef>
#include <cstdint>

namespace reconciliation::ports::input {

/**
 * @brief Группа выбора: операции выписки против операций учёта
 */
struct MatchRequest {
    int64_t reconciliationId = 0;
    std::vector<int64_t> statementTransactionIds;
    std::vector<int64_t> systemTransactionIds;
    domain::Date statementDate;
    int64_t actorId = 0;
};

/**
 * @brief Итог успешного сопоставления
 */
struct MatchOutcome {
    domain::Money statementSum;
    domain::Money systemSum;
    std::size_t matchedCount = 0;
};

/**
 * @brief Механизм сопоставления
 *
 * Сопоставление допускается, только если
 * |sum(выписка) - sum(учёт)| <= 0.01 при одинаковом соглашении о знаке.
 * Покрывает 1:1, 1:N и N:1 одним правилом.
 */
class IMatchingService {
public:
    virtual ~IMatchingService() = default;

    /**
     * @brief Закрепить группу операций за черновиком (всё или ничего)
     */
    virtual domain::Result<MatchOutcome> match(const MatchRequest& request) = 0;

    /**
     * @brief Снять закрепление с операций черновика (всё или ничего)
     * @return количество освобождённых операций
     */
    virtual domain::Result<std::size_t> unmatch(
        const std::vector<int64_t>& transactionIds, int64_t actorId) = 0;
};

} // namespace reconciliation::ports::input
