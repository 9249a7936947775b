#pragma once

#include "domain/Money.hpp"
#include "domain/Date.hpp"
#include <cstdint>

namespace reconciliation::ports::output {

/**
 * @brief Остаток счёта главной книги на дату
 */
class IBalanceOracle {
public:
    virtual ~IBalanceOracle() = default;

    /**
     * @brief Входящий остаток + проведённые обороты (дебет - кредит) по asOfDate включительно
     */
    virtual domain::Money getAccountBalance(int64_t glAccountId, const domain::Date& asOfDate) = 0;
};

} // namespace reconciliation::ports::output
