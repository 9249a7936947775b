#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "PathParams.hpp"
#include "JsonMapper.hpp"

#include <memory>
#include <string>
#include <vector>
#include <iostream>

namespace reconciliation::adapters::primary {

/**
 * @brief Маршрутизация вложенных путей с id в середине
 *
 * Сервер регистрирует только префикс с "*", а диспетчер сопоставляет
 * полный шаблон вида "/api/v1/reconciliations/{id}/match".
 * Шаблон без "{id}" имеет приоритет над шаблоном с параметром.
 */
class RouteDispatcher : public IHttpHandler {
public:
    void route(const std::string& method, const std::string& pattern, std::shared_ptr<IHttpHandler> handler) {
        routes_.push_back({method, PathParams::segments(pattern), std::move(handler)});
    }

    void handle(IRequest& req, IResponse& res) override {
        auto parts = PathParams::segments(req.getPath());

        const Route* best = nullptr;
        int bestParams = 0;
        bool pathMatched = false;

        for (const auto& route : routes_) {
            int params = 0;
            if (!matches(route.pattern, parts, params)) continue;
            pathMatched = true;
            if (route.method != req.getMethod()) continue;
            if (!best || params < bestParams) {
                best = &route;
                bestParams = params;
            }
        }

        if (best) {
            best->handler->handle(req, res);
            return;
        }
        if (pathMatched) {
            JsonMapper::sendError(res, 405, "METHOD_NOT_ALLOWED", "Method not allowed");
            return;
        }
        JsonMapper::sendError(res, 404, "NOT_FOUND", "No route for " + req.getPath());
    }

private:
    struct Route {
        std::string method;
        std::vector<std::string> pattern;
        std::shared_ptr<IHttpHandler> handler;
    };

    std::vector<Route> routes_;

    static bool matches(const std::vector<std::string>& pattern,
                        const std::vector<std::string>& parts,
                        int& params)
    {
        if (pattern.size() != parts.size()) return false;
        for (size_t i = 0; i < pattern.size(); ++i) {
            if (pattern[i] == "{id}") {
                if (!PathParams::isNumeric(parts[i])) return false;
                ++params;
            } else if (pattern[i] != parts[i]) {
                return false;
            }
        }
        return true;
    }
};

} // namespace reconciliation::adapters::primary
