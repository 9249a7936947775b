/**
 * @file HealthMetricsHandlerTest.cpp
 * @brief Unit-тесты для /health и /metrics
 */

#include <gtest/gtest.h>

#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "application/MetricsService.hpp"
#include "settings/MetricsSettings.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace reconciliation;
using namespace reconciliation::adapters::primary;

TEST(HealthHandlerTest, ReturnsHealthyStatus) {
    HealthHandler handler;
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/health");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["service"], "reconciliation-service");
}

TEST(MetricsHandlerTest, ExposesCountersInPrometheusFormat) {
    auto metrics = std::make_shared<application::MetricsService>(
        std::make_shared<settings::MetricsSettings>());
    metrics->increment("reconciliation_matches_total", {});
    MetricsHandler handler(metrics);

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/metrics");
    SimpleResponse res;

    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_NE(res.getBody().find("reconciliation_matches_total 1"), std::string::npos);
}
