#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "enums/TransactionType.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace reconciliation::domain {

/**
 * @brief Движение по банковскому счёту
 *
 * amount со знаком: поступление > 0, списание < 0.
 * isFromStatement = true: строка из банковской выписки,
 * false: операция, записанная в учёте организации.
 *
 * Инвариант: isReconciled == reconciliationId.has_value() == reconciledDate.has_value().
 */
struct BankTransaction {
    int64_t id = 0;
    int64_t bankAccountId = 0;
    Date transactionDate;
    Money amount;
    std::string description;
    std::string reference;
    TransactionType type = TransactionType::DEPOSIT;
    bool isFromStatement = false;
    bool isReconciled = false;
    std::optional<Date> reconciledDate;       ///< Дата выписки сверки, которая забрала строку
    std::optional<int64_t> reconciliationId;
};

/**
 * @brief Кандидаты для сопоставления, разделённые по источнику
 */
struct TransactionPartition {
    std::vector<BankTransaction> statementItems;
    std::vector<BankTransaction> systemItems;
};

} // namespace reconciliation::domain
