#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReconciliationDraftService.hpp"
#include "JsonMapper.hpp"
#include "PathParams.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief GET /api/v1/bank-accounts/{id}/reconciliations?page=1&page_size=20
 */
class ListHistoryHandler : public IHttpHandler {
public:
    static constexpr int kDefaultPage = 1;
    static constexpr int kDefaultPageSize = 20;

    explicit ListHistoryHandler(std::shared_ptr<ports::input::IReconciliationDraftService> draftService)
        : draftService_(std::move(draftService))
    {
        std::cout << "[ListHistoryHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            JsonMapper::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
            return;
        }

        auto bankAccountId = PathParams::idAt(req.getPath(), 3);
        if (!bankAccountId) {
            JsonMapper::sendValidation(res, "Bank account ID is required");
            return;
        }

        auto page = readInt(req, "page", kDefaultPage);
        auto pageSize = readInt(req, "page_size", kDefaultPageSize);
        if (!page || !pageSize) {
            JsonMapper::sendValidation(res, "page and page_size must be integers");
            return;
        }

        auto result = draftService_->listHistory(*bankAccountId, *page, *pageSize);
        if (!result.ok()) {
            JsonMapper::sendFailure(res, result.error());
            return;
        }

        nlohmann::json items = nlohmann::json::array();
        for (const auto& rec : result.value().items) {
            items.push_back(JsonMapper::toJson(rec));
        }

        nlohmann::json response;
        response["bank_account_id"] = *bankAccountId;
        response["page"] = *page;
        response["page_size"] = *pageSize;
        response["total_count"] = result.value().totalCount;
        response["items"] = items;
        JsonMapper::sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::input::IReconciliationDraftService> draftService_;

    static std::optional<int> readInt(IRequest& req, const std::string& name, int defaultValue) {
        auto raw = req.getQueryParam(name);
        if (!raw || raw->empty()) {
            return defaultValue;
        }
        try {
            size_t pos = 0;
            int value = std::stoi(*raw, &pos);
            if (pos != raw->size()) return std::nullopt;
            return value;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
};

} // namespace reconciliation::adapters::primary
