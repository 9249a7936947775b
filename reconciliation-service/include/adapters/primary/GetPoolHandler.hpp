#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReconciliationDraftService.hpp"
#include "JsonMapper.hpp"
#include "PathParams.hpp"
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief GET /api/v1/reconciliations/{id}/pool: несверенные кандидаты
 */
class GetPoolHandler : public IHttpHandler {
public:
    explicit GetPoolHandler(std::shared_ptr<ports::input::IReconciliationDraftService> draftService)
        : draftService_(std::move(draftService))
    {
        std::cout << "[GetPoolHandler] Created" << std::endl;
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

        auto result = draftService_->getUnreconciledPool(*id);
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
