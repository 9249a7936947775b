#pragma once

#include "domain/Result.hpp"
#include <cstdint>

namespace reconciliation::ports::input {

/**
 * @brief Запрос на проводку по строке выписки, которой нет в учёте
 */
struct AdjustmentRequest {
    int64_t reconciliationId = 0;
    int64_t statementTransactionId = 0;
    int64_t contraGlAccountId = 0;   ///< Счёт расходов (комиссия) или доходов (проценты)
    int64_t actorId = 0;
};

/**
 * @brief Проводки для комиссий и процентов, найденных при сверке
 */
class IAdjustmentService {
public:
    virtual ~IAdjustmentService() = default;

    /**
     * @return ID проведённой проводки
     */
    virtual domain::Result<int64_t> bookStatementItem(const AdjustmentRequest& request) = 0;
};

} // namespace reconciliation::ports::input
