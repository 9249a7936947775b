#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"
#include "PathParams.hpp"

#include <memory>
#include <string>

namespace reconciliation::adapters::primary {

/**
 * @brief Считает http_requests_total{method, path} и передаёт запрос дальше
 *
 * Числовые сегменты пути заменяются на {id}:
 * /api/v1/reconciliations/42/match -> /api/v1/reconciliations/{id}/match
 */
class MetricsDecoratorHandler : public IHttpHandler {
public:
    MetricsDecoratorHandler(
        std::shared_ptr<IHttpHandler> inner,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : inner_(std::move(inner))
      , metrics_(std::move(metrics))
    {}

    void handle(IRequest& req, IResponse& res) override {
        metrics_->increment("http_requests_total", {
            {"method", req.getMethod()},
            {"path", normalizePath(req.getPath())}
        });
        inner_->handle(req, res);
    }

    static std::string normalizePath(const std::string& path) {
        auto parts = PathParams::segments(path);
        if (parts.empty()) return "/";

        std::string out;
        for (const auto& part : parts) {
            out += "/";
            out += PathParams::isNumeric(part) ? "{id}" : part;
        }
        return out;
    }

private:
    std::shared_ptr<IHttpHandler> inner_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace reconciliation::adapters::primary
