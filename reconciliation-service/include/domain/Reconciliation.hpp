#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include "enums/ReconciliationStatus.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace reconciliation::domain {

/**
 * @brief Сверка одного банковского счёта на дату выписки
 *
 * Пока статус DRAFT, запись обновляется на месте (остаток выписки, заметки).
 * Переход в FINALIZED однократный и необратимый; calculatedBookBalance,
 * difference и finalizedAt заполняются только при финализации.
 */
struct Reconciliation {
    int64_t id = 0;
    int64_t bankAccountId = 0;
    Date statementDate;
    Money statementEndingBalance;
    std::optional<Money> calculatedBookBalance;
    std::optional<Money> difference;
    ReconciliationStatus status = ReconciliationStatus::DRAFT;
    std::string notes;
    int64_t createdBy = 0;
    Timestamp createdAt;
    std::optional<Timestamp> finalizedAt;

    bool isDraft() const { return status == ReconciliationStatus::DRAFT; }
    bool isFinalized() const { return status == ReconciliationStatus::FINALIZED; }
};

/**
 * @brief Страница истории финализированных сверок
 */
struct ReconciliationPage {
    std::vector<Reconciliation> items;
    int64_t totalCount = 0;
};

} // namespace reconciliation::domain
