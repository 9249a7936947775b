#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IFinalizationService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "JsonMapper.hpp"
#include "PathParams.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief POST /api/v1/reconciliations/{id}/finalize
 *
 * Body: {"statement_ending_balance": "1200.00", "calculated_book_balance": "1200.00",
 *        "difference": "0.00", "actor_id": 5}
 */
class FinalizeHandler : public IHttpHandler {
public:
    FinalizeHandler(
        std::shared_ptr<ports::input::IFinalizationService> finalizationService,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : finalizationService_(std::move(finalizationService))
      , metrics_(std::move(metrics))
    {
        std::cout << "[FinalizeHandler] Created" << std::endl;
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

            ports::input::FinalizeRequest request;
            request.reconciliationId = *id;
            request.statementEndingBalance = JsonMapper::readMoney(body, "statement_ending_balance");
            request.bookBalance = JsonMapper::readMoney(body, "calculated_book_balance");
            request.difference = JsonMapper::readMoney(body, "difference");
            request.actorId = JsonMapper::readId(body, "actor_id");

            auto result = finalizationService_->finalize(request);
            if (!result.ok()) {
                JsonMapper::sendFailure(res, result.error());
                return;
            }

            metrics_->increment("reconciliation_finalizations_total");
            JsonMapper::sendJson(res, 200, JsonMapper::toJson(result.value()));

        } catch (const nlohmann::json::exception& e) {
            JsonMapper::sendValidation(res, "Invalid JSON");
        } catch (const std::invalid_argument& e) {
            JsonMapper::sendValidation(res, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[FinalizeHandler] Error: " << e.what() << std::endl;
            JsonMapper::sendError(res, 500, "INTERNAL", "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IFinalizationService> finalizationService_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace reconciliation::adapters::primary
