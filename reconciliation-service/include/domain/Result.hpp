#pragma once

#include "ReconciliationError.hpp"
#include <optional>
#include <stdexcept>
#include <utility>

namespace reconciliation::domain {

/**
 * @brief Результат операции: значение либо ReconciliationError
 *
 * @example
 * ```cpp
 * ports::input::MatchRequest request;
 * request.reconciliationId = draftId;
 * request.statementTransactionIds = {101};
 * request.systemTransactionIds = {201, 202};
 * request.statementDate = Date::fromString("2024-03-31");
 * request.actorId = actorId;
 *
 * auto result = matchingService->match(request);
 * if (!result.ok()) {
 *     std::cout << toString(result.error().kind) << ": " << result.error().message;
 * }
 * ```
 */
template <typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(ReconciliationError error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return value_.has_value(); }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_->message);
        }
        return *value_;
    }

    const ReconciliationError& error() const {
        if (!error_) {
            throw std::logic_error("Result has no error");
        }
        return *error_;
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<ReconciliationError> error_;
};

} // namespace reconciliation::domain
