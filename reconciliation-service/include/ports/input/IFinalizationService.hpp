#pragma once

#include "domain/Reconciliation.hpp"
#include "domain/Result.hpp"
#include <cstdint>

namespace reconciliation::ports::input {

/**
 * @brief Запрос на финализацию: цифры, подтверждённые вызывающим
 */
struct FinalizeRequest {
    int64_t reconciliationId = 0;
    domain::Money statementEndingBalance;
    domain::Money bookBalance;
    domain::Money difference;
    int64_t actorId = 0;
};

/**
 * @brief Контроллер финализации
 */
class IFinalizationService {
public:
    virtual ~IFinalizationService() = default;

    /**
     * @brief Необратимо зафиксировать черновик
     *
     * NOT_BALANCED при |difference| >= 0.01, ALREADY_FINALIZED при повторном вызове.
     */
    virtual domain::Result<domain::Reconciliation> finalize(const FinalizeRequest& request) = 0;
};

} // namespace reconciliation::ports::input
