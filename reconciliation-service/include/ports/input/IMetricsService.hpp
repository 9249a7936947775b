#pragma once

#include <string>
#include <map>

namespace reconciliation::ports::input {

/**
 * @brief Счётчики в формате Prometheus
 *
 * @example
 * ```cpp
 * metricsService->increment("reconciliation_matches_total");
 * metricsService->increment("http_requests_total", {
 *     {"method", "POST"},
 *     {"path", "/api/v1/reconciliations/{id}/match"}
 * });
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Увеличить счётчик на 1 (неизвестный ключ создаётся со значением 1)
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @return Prometheus text format 0.0.4
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace reconciliation::ports::input
