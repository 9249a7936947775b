#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReconciliationDraftService.hpp"
#include "JsonMapper.hpp"
#include "PathParams.hpp"
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief GET /api/v1/reconciliations/{id}/items: операции, закреплённые за сверкой
 */
class GetItemsHandler : public IHttpHandler {
public:
    explicit GetItemsHandler(std::shared_ptr<ports::input::IReconciliationDraftService> draftService)
        : draftService_(std::move(draftService))
    {
        std::cout << "[GetItemsHandler] Created" << std::endl;
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

        auto result = draftService_->getItemsForReconciliation(*id);
        if (!result.ok()) {
            JsonMapper::sendFailure(res, result.error());
            return;
        }
        JsonMapper::sendJson(res, 200, JsonMapper::toJson(result.value()));
    }

private:
    std::shared_ptr<ports::input::IReconciliationDraftService> draftService_;
};

} // namespace reconciliation::adapters::primary
