#pragma once

#include "ports/output/IVatAggregator.hpp"
#include "settings/IAggregatorClientSettings.hpp"
#include "domain/errors/VatErrors.hpp"
#include "adapters/secondary/UrlEncode.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <system_error>
#include <thread>

namespace vat::adapters::secondary {

/**
 * @brief HTTP клиент к агрегатору НДС
 *
 * GET /api/v1/vat/totals?client_id=&date_from=&date_to=
 *   -> {"output_vat": "1000.00", "input_vat": 400}
 *
 * Запрос ограничен по времени (VAT_AGGREGATOR_TIMEOUT_MS): send выполняется
 * в отдельном потоке, ожидание через future::wait_for. Таймаут, сбой
 * транспорта и не-200 превращаются в AggregatorUnavailableError.
 *
 * Поток после таймаута продолжает ждать send и держит слот, пока тот не
 * вернётся. Число занятых слотов ограничено VAT_AGGREGATOR_MAX_IN_FLIGHT:
 * сверх предела запрос сразу отклоняется как AggregatorUnavailableError.
 */
class HttpVatAggregator : public ports::output::IVatAggregator {
public:
    HttpVatAggregator(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IAggregatorClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpVatAggregator] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << ", timeout " << settings_->getTimeoutMs() << "ms"
                  << ", max in flight " << settings_->getMaxInFlight() << std::endl;
    }

    domain::VatTotals getTotals(const std::string& clientId, const domain::DateRange& range) override {
        std::string path = "/api/v1/vat/totals?client_id=" + urlEncode(clientId) +
                           "&date_from=" + range.from.toString() +
                           "&date_to=" + range.to.toString();

        auto response = doGetWithTimeout(path);

        if (response.getStatus() != 200) {
            std::cerr << "[HttpVatAggregator] getTotals failed: " << response.getStatus() << std::endl;
            throw domain::AggregatorUnavailableError(
                "VAT aggregator responded with status " + std::to_string(response.getStatus()));
        }

        return parseTotals(response.getBody());
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IAggregatorClientSettings> settings_;
    // Переживает агрегатор: его уменьшают отсоединённые потоки
    std::shared_ptr<std::atomic<int>> inFlight_ = std::make_shared<std::atomic<int>>(0);

    /**
     * @brief Запрос и ответ живут, пока не завершится поток отправки
     */
    struct Exchange {
        explicit Exchange(SimpleRequest req) : request(std::move(req)) {}
        SimpleRequest request;
        SimpleResponse response;
    };

    SimpleResponse doGetWithTimeout(const std::string& path) {
        int limit = settings_->getMaxInFlight();
        if (inFlight_->fetch_add(1) >= limit) {
            inFlight_->fetch_sub(1);
            std::cerr << "[HttpVatAggregator] " << limit << " requests still pending, rejecting: " << path << std::endl;
            throw domain::AggregatorUnavailableError(
                "VAT aggregator has " + std::to_string(limit) + " requests pending");
        }

        auto exchange = std::make_shared<Exchange>(SimpleRequest(
            "GET",
            path,
            "",
            settings_->getHost(),
            settings_->getPort(),
            {}
        ));

        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();

        try {
            std::thread([client = httpClient_, exchange, promise, inFlight = inFlight_]() mutable {
                try {
                    bool sent = client->send(exchange->request, exchange->response);
                    client.reset();
                    inFlight->fetch_sub(1);
                    promise->set_value(sent);
                } catch (...) {
                    client.reset();
                    inFlight->fetch_sub(1);
                    promise->set_exception(std::current_exception());
                }
            }).detach();
        } catch (const std::system_error& e) {
            inFlight_->fetch_sub(1);
            std::cerr << "[HttpVatAggregator] Cannot start request thread: " << e.what() << std::endl;
            throw domain::AggregatorUnavailableError(std::string("VAT aggregator request not started: ") + e.what());
        }

        auto timeout = std::chrono::milliseconds(settings_->getTimeoutMs());
        if (future.wait_for(timeout) != std::future_status::ready) {
            std::cerr << "[HttpVatAggregator] Timeout after " << timeout.count() << "ms: " << path << std::endl;
            throw domain::AggregatorUnavailableError(
                "VAT aggregator did not respond within " + std::to_string(timeout.count()) + "ms");
        }

        bool sent = false;
        try {
            sent = future.get();
        } catch (const std::exception& e) {
            std::cerr << "[HttpVatAggregator] Transport error: " << e.what() << std::endl;
            throw domain::AggregatorUnavailableError(std::string("VAT aggregator request failed: ") + e.what());
        }

        if (!sent) {
            std::cerr << "[HttpVatAggregator] Request not sent: " << path << std::endl;
            throw domain::AggregatorUnavailableError("VAT aggregator is unreachable");
        }

        return exchange->response;
    }

    static domain::VatTotals parseTotals(const std::string& body) {
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(body);
        } catch (const nlohmann::json::exception& e) {
            throw domain::InvalidTotalsError(std::string("VAT aggregator returned malformed JSON: ") + e.what());
        }

        if (!json.is_object()) {
            throw domain::InvalidTotalsError("VAT aggregator returned non-object totals");
        }

        domain::VatTotals totals;
        totals.outputVat = parseAmount(json, "output_vat");
        totals.inputVat = parseAmount(json, "input_vat");
        return totals;
    }

    // Сумма может прийти строкой ("1000.00") или числом (1000)
    static domain::Money parseAmount(const nlohmann::json& json, const char* field) {
        if (!json.contains(field)) {
            throw domain::InvalidTotalsError(std::string("VAT aggregator response has no ") + field);
        }

        const auto& value = json[field];
        domain::Money amount;
        try {
            if (value.is_string()) {
                amount = domain::Money::fromString(value.get<std::string>());
            } else if (value.is_number()) {
                amount = domain::Money::fromDouble(value.get<double>());
            } else {
                throw domain::InvalidTotalsError(std::string(field) + " is not a number");
            }
        } catch (const domain::ValidationError& e) {
            throw domain::InvalidTotalsError(std::string(field) + ": " + e.what());
        }

        if (amount.isNegative()) {
            throw domain::InvalidTotalsError(std::string(field) + " is negative: " + amount.toString());
        }
        return amount;
    }
};

} // namespace vat::adapters::secondary
