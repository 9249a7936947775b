#pragma once

#include <string>
#include <cstdint>

namespace reconciliation::domain {

/**
 * @brief Банковский счёт (внешняя сущность, только чтение)
 *
 * glAccountId: счёт главной книги, баланс которого даёт IBalanceOracle.
 */
struct BankAccount {
    int64_t id = 0;
    int64_t glAccountId = 0;
    std::string currencyCode;
    std::string name;
    bool isActive = true;
};

} // namespace reconciliation::domain
