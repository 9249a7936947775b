#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/JournalClientSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Application
#include "application/ReconciliationDraftService.hpp"
#include "application/MatchingService.hpp"
#include "application/BalanceSummaryService.hpp"
#include "application/FinalizationService.hpp"
#include "application/AdjustmentService.hpp"
#include "application/MetricsService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresConnection.hpp"
#include "adapters/secondary/PostgresReconciliationRepository.hpp"
#include "adapters/secondary/PostgresTransactionPool.hpp"
#include "adapters/secondary/PostgresBalanceOracle.hpp"
#include "adapters/secondary/PostgresBankAccountDirectory.hpp"
#include "adapters/secondary/HttpJournalEntryFactory.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "adapters/primary/RouteDispatcher.hpp"
#include "adapters/primary/CreateDraftHandler.hpp"
#include "adapters/primary/GetReconciliationHandler.hpp"
#include "adapters/primary/GetSummaryHandler.hpp"
#include "adapters/primary/GetPoolHandler.hpp"
#include "adapters/primary/GetItemsHandler.hpp"
#include "adapters/primary/MatchHandler.hpp"
#include "adapters/primary/UnmatchHandler.hpp"
#include "adapters/primary/FinalizeHandler.hpp"
#include "adapters/primary/BookAdjustmentHandler.hpp"
#include "adapters/primary/ListHistoryHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace reconciliation {

/**
 * @brief Reconciliation Service Application
 *
 * HTTP API сверки банковских счетов поверх общей БД бухгалтерии.
 * Корректирующие проводки создаются через Journal Service.
 */
class ReconciliationApp : public BoostBeastApplication {
public:
    ReconciliationApp() { std::cout << "[ReconciliationApp] Initializing..." << std::endl; }
    ~ReconciliationApp() override { std::cout << "[ReconciliationApp] Shutting down..." << std::endl; }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[ReconciliationApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[ReconciliationApp] Configuring DI..." << std::endl;

        auto injector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<settings::IJournalClientSettings>().to<settings::JournalClientSettings>().in(di::singleton),
            di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

            di::bind<adapters::secondary::PostgresConnection>().in(di::singleton),
            di::bind<ports::output::IReconciliationRepository>()
                .to<adapters::secondary::PostgresReconciliationRepository>().in(di::singleton),
            di::bind<ports::output::ITransactionPool>()
                .to<adapters::secondary::PostgresTransactionPool>().in(di::singleton),
            di::bind<ports::output::IBalanceOracle>()
                .to<adapters::secondary::PostgresBalanceOracle>().in(di::singleton),
            di::bind<ports::output::IBankAccountDirectory>()
                .to<adapters::secondary::PostgresBankAccountDirectory>().in(di::singleton),

            di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
            di::bind<ports::output::IJournalEntryFactory>()
                .to<adapters::secondary::HttpJournalEntryFactory>().in(di::singleton),

            di::bind<ports::input::IReconciliationDraftService>()
                .to<application::ReconciliationDraftService>().in(di::singleton),
            di::bind<ports::input::IMatchingService>().to<application::MatchingService>().in(di::singleton),
            di::bind<ports::input::IBalanceSummaryService>()
                .to<application::BalanceSummaryService>().in(di::singleton),
            di::bind<ports::input::IFinalizationService>()
                .to<application::FinalizationService>().in(di::singleton),
            di::bind<ports::input::IAdjustmentService>().to<application::AdjustmentService>().in(di::singleton),
            di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton));

        auto metrics = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
        auto withMetrics = [&metrics](std::shared_ptr<IHttpHandler> handler) {
            return std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics);
        };

        handlers_[getHandlerKey("GET", "/health")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
        handlers_[getHandlerKey("GET", "/metrics")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>());

        handlers_[getHandlerKey("POST", "/api/v1/reconciliations")] =
            withMetrics(injector.create<std::shared_ptr<adapters::primary::CreateDraftHandler>>());

        // Вложенные пути с id разбирает RouteDispatcher
        auto reconciliations = std::make_shared<adapters::primary::RouteDispatcher>();
        reconciliations->route("GET", "/api/v1/reconciliations/{id}",
            injector.create<std::shared_ptr<adapters::primary::GetReconciliationHandler>>());
        reconciliations->route("GET", "/api/v1/reconciliations/{id}/summary",
            injector.create<std::shared_ptr<adapters::primary::GetSummaryHandler>>());
        reconciliations->route("GET", "/api/v1/reconciliations/{id}/pool",
            injector.create<std::shared_ptr<adapters::primary::GetPoolHandler>>());
        reconciliations->route("GET", "/api/v1/reconciliations/{id}/items",
            injector.create<std::shared_ptr<adapters::primary::GetItemsHandler>>());
        reconciliations->route("POST", "/api/v1/reconciliations/{id}/match",
            injector.create<std::shared_ptr<adapters::primary::MatchHandler>>());
        reconciliations->route("POST", "/api/v1/reconciliations/unmatch",
            injector.create<std::shared_ptr<adapters::primary::UnmatchHandler>>());
        reconciliations->route("POST", "/api/v1/reconciliations/{id}/finalize",
            injector.create<std::shared_ptr<adapters::primary::FinalizeHandler>>());
        reconciliations->route("POST", "/api/v1/reconciliations/{id}/adjustments",
            injector.create<std::shared_ptr<adapters::primary::BookAdjustmentHandler>>());

        auto reconciliationRoutes = withMetrics(reconciliations);
        handlers_[getHandlerKey("GET", "/api/v1/reconciliations/*")] = reconciliationRoutes;
        handlers_[getHandlerKey("POST", "/api/v1/reconciliations/*")] = reconciliationRoutes;
        handlers_[getHandlerKey("GET", "/api/v1/reconciliations/*/*")] = reconciliationRoutes;
        handlers_[getHandlerKey("POST", "/api/v1/reconciliations/*/*")] = reconciliationRoutes;

        auto bankAccounts = std::make_shared<adapters::primary::RouteDispatcher>();
        bankAccounts->route("GET", "/api/v1/bank-accounts/{id}/reconciliations",
            injector.create<std::shared_ptr<adapters::primary::ListHistoryHandler>>());

        auto bankAccountRoutes = withMetrics(bankAccounts);
        handlers_[getHandlerKey("GET", "/api/v1/bank-accounts/*")] = bankAccountRoutes;
        handlers_[getHandlerKey("GET", "/api/v1/bank-accounts/*/*")] = bankAccountRoutes;

        std::cout << "[ReconciliationApp] Ready" << std::endl;
    }
};

} // namespace reconciliation
