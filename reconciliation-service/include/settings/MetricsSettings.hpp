#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace reconciliation::settings {

/**
 * @brief Метрики Reconciliation Service
 *
 * HTTP счётчики по нормализованным путям (id заменён на {id})
 * и бизнес-счётчики операций сверки.
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"reconciliation_drafts_total", "Draft sessions opened or resumed", "counter"},
            {"reconciliation_matches_total", "Successful match operations", "counter"},
            {"reconciliation_match_rejections_total", "Rejected match operations", "counter"},
            {"reconciliation_unmatches_total", "Successful unmatch operations", "counter"},
            {"reconciliation_finalizations_total", "Finalized reconciliations", "counter"},
            {"reconciliation_adjustments_total", "Journal entries booked for statement items", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // Health & Metrics
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",

            // Reconciliations
            "http_requests_total{method=\"POST\",path=\"/api/v1/reconciliations\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/reconciliations/{id}\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/reconciliations/{id}/summary\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/reconciliations/{id}/pool\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/reconciliations/{id}/items\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/reconciliations/{id}/match\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/reconciliations/unmatch\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/reconciliations/{id}/finalize\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/reconciliations/{id}/adjustments\"}",

            // History
            "http_requests_total{method=\"GET\",path=\"/api/v1/bank-accounts/{id}/reconciliations\"}",

            // Бизнес метрики (без labels)
            "reconciliation_drafts_total",
            "reconciliation_matches_total",
            "reconciliation_match_rejections_total",
            "reconciliation_unmatches_total",
            "reconciliation_finalizations_total",
            "reconciliation_adjustments_total"
        };
    }
};

} // namespace reconciliation::settings
