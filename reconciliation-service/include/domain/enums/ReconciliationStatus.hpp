#pragma once

#include <string>
#include <stdexcept>

namespace reconciliation::domain {

/**
 * @brief Статус сверки: черновик меняется, финализированная сверка неизменна
 */
enum class ReconciliationStatus {
    DRAFT,
    FINALIZED
};

inline std::string toString(ReconciliationStatus status) {
    switch (status) {
        case ReconciliationStatus::DRAFT:     return "Draft";
        case ReconciliationStatus::FINALIZED: return "Finalized";
        default: return "UNKNOWN";
    }
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ReconciliationStatus parseReconciliationStatus(const std::string& str) {
    if (str == "Draft" || str == "DRAFT")         return ReconciliationStatus::DRAFT;
    if (str == "Finalized" || str == "FINALIZED") return ReconciliationStatus::FINALIZED;
    throw std::invalid_argument("Unknown reconciliation status: " + str);
}

} // namespace reconciliation::domain
