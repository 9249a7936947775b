#pragma once

#include "ports/output/IJournalEntryFactory.hpp"
#include "domain/ReconciliationError.hpp"
#include "settings/IJournalClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace reconciliation::adapters::secondary {

/**
 * @brief HTTP клиент к Journal Service
 *
 * POST /api/v1/journal-entries с флагом post=true: сервис журнала создаёт
 * проводку, проводит её и порождает системную банковскую операцию.
 * Ответ 200/201 с {"id": ...}; всё остальное: PersistenceError.
 */
class HttpJournalEntryFactory : public ports::output::IJournalEntryFactory {
public:
    HttpJournalEntryFactory(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IJournalClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpJournalEntryFactory] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    int64_t createAndPost(const domain::JournalEntryRequest& request) override {
        SimpleRequest httpRequest(
            "POST",
            "/api/v1/journal-entries",
            toJson(request).dump(),
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );

        SimpleResponse response;
        if (!httpClient_->send(httpRequest, response)) {
            std::cerr << "[HttpJournalEntryFactory] Journal service unreachable" << std::endl;
            throw domain::PersistenceError("Journal service unreachable");
        }

        if (response.getStatus() != 200 && response.getStatus() != 201) {
            std::cerr << "[HttpJournalEntryFactory] createAndPost failed: "
                      << response.getStatus() << " " << response.getBody() << std::endl;
            throw domain::PersistenceError(
                "Journal service returned " + std::to_string(response.getStatus()));
        }

        try {
            auto body = nlohmann::json::parse(response.getBody());
            return body.at("id").get<int64_t>();
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[HttpJournalEntryFactory] Bad response: " << e.what() << std::endl;
            throw domain::PersistenceError(std::string("Invalid journal service response: ") + e.what());
        }
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IJournalClientSettings> settings_;

    static nlohmann::json toJson(const domain::JournalEntryRequest& request) {
        nlohmann::json lines = nlohmann::json::array();
        for (const auto& line : request.lines) {
            lines.push_back({
                {"account_id", line.glAccountId},
                {"debit_amount", line.debit.toString()},
                {"credit_amount", line.credit.toString()},
                {"description", line.description},
                {"currency_code", line.currencyCode}
            });
        }

        return {
            {"entry_date", request.entryDate.toString()},
            {"entry_type", "General"},
            {"description", request.description},
            {"reference", request.reference},
            {"user_id", request.actorId},
            {"post", true},
            {"lines", lines}
        };
    }
};

} // namespace reconciliation::adapters::secondary
