#pragma once

#include <string>
#include <stdexcept>

namespace reconciliation::domain {

/**
 * @brief Тип банковской операции
 *
 * Значения совпадают с CHECK constraint business.bank_transactions.transaction_type.
 */
enum class TransactionType {
    DEPOSIT,
    WITHDRAWAL,
    INTEREST,
    FEE,
    TRANSFER,
    ADJUSTMENT
};

/**
 * @brief Преобразовать TransactionType в строку
 */
inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::DEPOSIT:    return "Deposit";
        case TransactionType::WITHDRAWAL: return "Withdrawal";
        case TransactionType::INTEREST:   return "Interest";
        case TransactionType::FEE:        return "Fee";
        case TransactionType::TRANSFER:   return "Transfer";
        case TransactionType::ADJUSTMENT: return "Adjustment";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Преобразовать строку в TransactionType
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType parseTransactionType(const std::string& str) {
    if (str == "Deposit" || str == "DEPOSIT")       return TransactionType::DEPOSIT;
    if (str == "Withdrawal" || str == "WITHDRAWAL") return TransactionType::WITHDRAWAL;
    if (str == "Interest" || str == "INTEREST")     return TransactionType::INTEREST;
    if (str == "Fee" || str == "FEE")               return TransactionType::FEE;
    if (str == "Transfer" || str == "TRANSFER")     return TransactionType::TRANSFER;
    if (str == "Adjustment" || str == "ADJUSTMENT") return TransactionType::ADJUSTMENT;
    throw std::invalid_argument("Unknown transaction type: " + str);
}

} // namespace reconciliation::domain
