#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace reconciliation::domain {

/**
 * @brief Строка проводки: ровно одна из сумм debit/credit ненулевая
 */
struct JournalLine {
    int64_t glAccountId = 0;
    Money debit;
    Money credit;
    std::string description;
    std::string currencyCode;
};

/**
 * @brief Корректирующая проводка для строки выписки (комиссия, проценты)
 */
struct JournalEntryRequest {
    Date entryDate;
    std::string description;
    std::string reference;
    int64_t actorId = 0;
    std::vector<JournalLine> lines;
};

} // namespace reconciliation::domain
