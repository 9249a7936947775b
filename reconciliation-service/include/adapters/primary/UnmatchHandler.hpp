#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IMatchingService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "JsonMapper.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief POST /api/v1/reconciliations/unmatch
 *
 * Body: {"transaction_ids": [..], "actor_id": 5}
 */
class UnmatchHandler : public IHttpHandler {
public:
    UnmatchHandler(
        std::shared_ptr<ports::input::IMatchingService> matchingService,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : matchingService_(std::move(matchingService))
      , metrics_(std::move(metrics))
    {
        std::cout << "[UnmatchHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            JsonMapper::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());
            auto ids = JsonMapper::readIds(body, "transaction_ids");
            int64_t actorId = JsonMapper::readId(body, "actor_id");

            auto result = matchingService_->unmatch(ids, actorId);
            if (!result.ok()) {
                JsonMapper::sendFailure(res, result.error());
                return;
            }

            metrics_->increment("reconciliation_unmatches_total");

            nlohmann::json response;
            response["unmatched_count"] = result.value();
            JsonMapper::sendJson(res, 200, response);

        } catch (const nlohmann::json::exception& e) {
            JsonMapper::sendValidation(res, "Invalid JSON");
        } catch (const std::invalid_argument& e) {
            JsonMapper::sendValidation(res, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[UnmatchHandler] Error: " << e.what() << std::endl;
            JsonMapper::sendError(res, 500, "INTERNAL", "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IMatchingService> matchingService_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace reconciliation::adapters::primary
