#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMatchingService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "JsonMapper.hpp"
#include "PathParams.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief POST /api/v1/reconciliations/{id}/match
 *
 * Body: {"statement_transaction_ids": [..], "system_transaction_ids": [..],
 *        "statement_date": "2024-01-31", "actor_id": 5}
 */
class MatchHandler : public IHttpHandler {
public:
    MatchHandler(
        std::shared_ptr<ports::input::IMatchingService> matchingService,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : matchingService_(std::move(matchingService))
      , metrics_(std::move(metrics))
    {
        std::cout << "[MatchHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            JsonMapper::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
            return;
        }

        auto id = PathParams::idAt(req.getPath(), 3);
        if (!id) {
            JsonMapper::sendValidation(res, "Reconciliation ID is required");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());

            ports::input::MatchRequest request;
            request.reconciliationId = *id;
            request.statementTransactionIds = JsonMapper::readIds(body, "statement_transaction_ids");
            request.systemTransactionIds = JsonMapper::readIds(body, "system_transaction_ids");
            request.statementDate = JsonMapper::readDate(body, "statement_date");
            request.actorId = JsonMapper::readId(body, "actor_id");

            auto result = matchingService_->match(request);
            if (!result.ok()) {
                metrics_->increment("reconciliation_match_rejections_total");
                JsonMapper::sendFailure(res, result.error());
                return;
            }

            metrics_->increment("reconciliation_matches_total");

            const auto& outcome = result.value();
            nlohmann::json response;
            response["reconciliation_id"] = *id;
            response["matched_count"] = outcome.matchedCount;
            response["statement_sum"] = outcome.statementSum.toString();
            response["system_sum"] = outcome.systemSum.toString();
            JsonMapper::sendJson(res, 200, response);

        } catch (const nlohmann::json::exception& e) {
            JsonMapper::sendValidation(res, "Invalid JSON");
        } catch (const std::invalid_argument& e) {
            JsonMapper::sendValidation(res, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[MatchHandler] Error: " << e.what() << std::endl;
            JsonMapper::sendError(res, 500, "INTERNAL", "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IMatchingService> matchingService_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace reconciliation::adapters::primary
