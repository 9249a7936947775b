#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReconciliationDraftService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "JsonMapper.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief POST /api/v1/reconciliations: открыть или продолжить черновик
 *
 * Body: {"bank_account_id": 1, "statement_date": "2024-01-31",
 *        "statement_ending_balance": "1200.00", "notes": "...", "actor_id": 5}
 */
class CreateDraftHandler : public IHttpHandler {
public:
    CreateDraftHandler(
        std::shared_ptr<ports::input::IReconciliationDraftService> draftService,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : draftService_(std::move(draftService))
      , metrics_(std::move(metrics))
    {
        std::cout << "[CreateDraftHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            JsonMapper::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
            return;
        }

        try {
            auto body = nlohmann::json::parse(req.getBody());

            ports::input::DraftRequest request;
            request.bankAccountId = JsonMapper::readId(body, "bank_account_id");
            request.statementDate = JsonMapper::readDate(body, "statement_date");
            request.statementEndingBalance = JsonMapper::readMoney(body, "statement_ending_balance");
            request.actorId = JsonMapper::readId(body, "actor_id");
            if (body.contains("notes") && body["notes"].is_string()) {
                request.notes = body["notes"].get<std::string>();
            }

            auto result = draftService_->getOrCreateDraft(request);
            if (!result.ok()) {
                JsonMapper::sendFailure(res, result.error());
                return;
            }

            metrics_->increment("reconciliation_drafts_total");
            JsonMapper::sendJson(res, 200, JsonMapper::toJson(result.value()));

        } catch (const nlohmann::json::exception& e) {
            JsonMapper::sendValidation(res, "Invalid JSON");
        } catch (const std::invalid_argument& e) {
            JsonMapper::sendValidation(res, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[CreateDraftHandler] Error: " << e.what() << std::endl;
            JsonMapper::sendError(res, 500, "INTERNAL", "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IReconciliationDraftService> draftService_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace reconciliation::adapters::primary
