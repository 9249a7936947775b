#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAdjustmentService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "JsonMapper.hpp"
#include "PathParams.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief POST /api/v1/reconciliations/{id}/adjustments
 *
 * Body: {"statement_transaction_id": 12, "contra_gl_account_id": 610, "actor_id": 5}
 */
class BookAdjustmentHandler : public IHttpHandler {
public:
    BookAdjustmentHandler(
        std::shared_ptr<ports::input::IAdjustmentService> adjustmentService,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : adjustmentService_(std::move(adjustmentService))
      , metrics_(std::move(metrics))
    {
        std::cout << "[BookAdjustmentHandler] Created" << std::endl;
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

            ports::input::AdjustmentRequest request;
            request.reconciliationId = *id;
            request.statementTransactionId = JsonMapper::readId(body, "statement_transaction_id");
            request.contraGlAccountId = JsonMapper::readId(body, "contra_gl_account_id");
            request.actorId = JsonMapper::readId(body, "actor_id");

            auto result = adjustmentService_->bookStatementItem(request);
            if (!result.ok()) {
                JsonMapper::sendFailure(res, result.error());
                return;
            }

            metrics_->increment("reconciliation_adjustments_total");

            nlohmann::json response;
            response["reconciliation_id"] = *id;
            response["statement_transaction_id"] = request.statementTransactionId;
            response["journal_entry_id"] = result.value();
            JsonMapper::sendJson(res, 201, response);

        } catch (const nlohmann::json::exception& e) {
            JsonMapper::sendValidation(res, "Invalid JSON");
        } catch (const std::invalid_argument& e) {
            JsonMapper::sendValidation(res, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[BookAdjustmentHandler] Error: " << e.what() << std::endl;
            JsonMapper::sendError(res, 500, "INTERNAL", "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IAdjustmentService> adjustmentService_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace reconciliation::adapters::primary
