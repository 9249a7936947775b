#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IBalanceSummaryService.hpp"
#include "JsonMapper.hpp"
#include "PathParams.hpp"
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief GET /api/v1/reconciliations/{id}/summary[?statement_ending_balance=...]
 *
 * Без параметра используется остаток выписки, сохранённый в сверке.
 */
class GetSummaryHandler : public IHttpHandler {
public:
    explicit GetSummaryHandler(std::shared_ptr<ports::input::IBalanceSummaryService> summaryService)
        : summaryService_(std::move(summaryService))
    {
        std::cout << "[GetSummaryHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            JsonMapper::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
            return;
        }

        auto id = PathParams::idAt(req.getPath(), 3);
        if (!id) {
            JsonMapper::sendValidation(res, "Reconciliation ID is required");
            return;
        }

        std::optional<domain::Money> statementBalance;
        auto balanceParam = req.getQueryParam("statement_ending_balance");
        if (balanceParam && !balanceParam->empty()) {
            try {
                statementBalance = domain::Money::fromString(*balanceParam);
            } catch (const std::invalid_argument& e) {
                JsonMapper::sendValidation(res, e.what());
                return;
            }
        }

        auto result = summaryService_->calculateSummary(*id, statementBalance);
        if (!result.ok()) {
            JsonMapper::sendFailure(res, result.error());
            return;
        }

        auto body = JsonMapper::toJson(result.value());
        body["reconciliation_id"] = *id;
        JsonMapper::sendJson(res, 200, body);
    }

private:
    std::shared_ptr<ports::input::IBalanceSummaryService> summaryService_;
};

} // namespace reconciliation::adapters::primary
