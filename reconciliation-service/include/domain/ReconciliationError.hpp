#pragma once

#include "Money.hpp"
#include <string>
#include <optional>
#include <stdexcept>
#include <cstdint>

namespace reconciliation::domain {

/**
 * @brief Вид ошибки операции сверки
 *
 * Все виды, кроме PERSISTENCE, означают нарушения бизнес-правил; они возвращаются
 * значением и не меняют состояние хранилища.
 */
enum class ErrorKind {
    VALIDATION,            ///< Пустой/чужой/некорректный выбор, неверный ввод
    UNBALANCED_SELECTION,  ///< Суммы выписки и учёта расходятся больше допуска
    IMMUTABLE_RECORD,      ///< Попытка изменить финализированную сверку
    NOT_BALANCED,          ///< Финализация при ненулевой разнице
    ALREADY_FINALIZED,     ///< Повторная финализация
    NOT_FOUND,             ///< Сверка, счёт или операция не найдены
    PERSISTENCE            ///< Сбой хранилища, транзакция откачена
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:           return "VALIDATION";
        case ErrorKind::UNBALANCED_SELECTION: return "UNBALANCED_SELECTION";
        case ErrorKind::IMMUTABLE_RECORD:     return "IMMUTABLE_RECORD";
        case ErrorKind::NOT_BALANCED:         return "NOT_BALANCED";
        case ErrorKind::ALREADY_FINALIZED:    return "ALREADY_FINALIZED";
        case ErrorKind::NOT_FOUND:            return "NOT_FOUND";
        case ErrorKind::PERSISTENCE:          return "PERSISTENCE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Описание отказа с деталями для сообщения пользователю
 */
struct ReconciliationError {
    ErrorKind kind = ErrorKind::VALIDATION;
    std::string message;
    std::optional<Money> statementSum;   ///< UNBALANCED_SELECTION
    std::optional<Money> systemSum;      ///< UNBALANCED_SELECTION
    std::optional<Money> tolerance;      ///< UNBALANCED_SELECTION, NOT_BALANCED
    std::optional<int64_t> recordId;     ///< Запись, на которой споткнулась операция

    static ReconciliationError validation(const std::string& msg,
                                          std::optional<int64_t> recordId = std::nullopt) {
        ReconciliationError e;
        e.kind = ErrorKind::VALIDATION;
        e.message = msg;
        e.recordId = recordId;
        return e;
    }

    static ReconciliationError notFound(const std::string& msg, int64_t recordId) {
        ReconciliationError e;
        e.kind = ErrorKind::NOT_FOUND;
        e.message = msg;
        e.recordId = recordId;
        return e;
    }

    static ReconciliationError unbalanced(const Money& statementSum, const Money& systemSum) {
        ReconciliationError e;
        e.kind = ErrorKind::UNBALANCED_SELECTION;
        e.message = "Selected statement items total (" + statementSum.toString() +
                    ") does not match selected system items total (" + systemSum.toString() + ")";
        e.statementSum = statementSum;
        e.systemSum = systemSum;
        e.tolerance = kTolerance;
        return e;
    }

    static ReconciliationError immutable(const std::string& msg, int64_t recordId) {
        ReconciliationError e;
        e.kind = ErrorKind::IMMUTABLE_RECORD;
        e.message = msg;
        e.recordId = recordId;
        return e;
    }

    static ReconciliationError notBalanced(const std::string& msg, int64_t recordId) {
        ReconciliationError e;
        e.kind = ErrorKind::NOT_BALANCED;
        e.message = msg;
        e.tolerance = kTolerance;
        e.recordId = recordId;
        return e;
    }

    static ReconciliationError alreadyFinalized(int64_t recordId) {
        ReconciliationError e;
        e.kind = ErrorKind::ALREADY_FINALIZED;
        e.message = "Reconciliation " + std::to_string(recordId) + " is already finalized";
        e.recordId = recordId;
        return e;
    }

    static ReconciliationError persistence(const std::string& msg) {
        ReconciliationError e;
        e.kind = ErrorKind::PERSISTENCE;
        e.message = msg;
        return e;
    }
};

/**
 * @brief Сбой хранилища или внешнего сервиса
 *
 * Бросается вторичными адаптерами; сервисы приложения перехватывают его
 * на своей границе и возвращают ErrorKind::PERSISTENCE.
 */
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace reconciliation::domain
