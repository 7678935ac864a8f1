#pragma once

#include "ports/output/IClientRegistry.hpp"
#include "settings/ClientRegistrySettings.hpp"
#include "adapters/secondary/UrlEncode.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <optional>
#include <string>

namespace vat::adapters::secondary {

/**
 * @brief HTTP клиент к реестру клиентов
 *
 * GET /api/v1/clients/{id}        -> {"id", "name", "tax_id"}
 * GET /api/v1/clients?tax_id={inn} -> [{"id", "name", "tax_id"}, ...]
 * id в ответе бывает строкой или числом (целочисленный первичный ключ).
 * Любой сбой даёт nullopt: ответ сервиса сверки просто не обогащается.
 */
class HttpClientRegistry : public ports::output::IClientRegistry {
public:
    HttpClientRegistry(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::ClientRegistrySettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpClientRegistry] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    std::optional<domain::ClientInfo> findClient(const std::string& clientId) override {
        try {
            auto json = doGet("/api/v1/clients/" + urlEncode(clientId));
            if (!json) {
                return std::nullopt;
            }
            if (!json->is_object()) {
                std::cerr << "[HttpClientRegistry] findClient: non-object body for " << clientId << std::endl;
                return std::nullopt;
            }
            return toClientInfo(*json, clientId);
        } catch (const std::exception& e) {
            std::cerr << "[HttpClientRegistry] findClient error: " << e.what() << std::endl;
        }

        return std::nullopt;
    }

    std::optional<domain::ClientInfo> findClientByTaxId(const std::string& taxId) override {
        try {
            auto json = doGet("/api/v1/clients?tax_id=" + urlEncode(taxId));
            if (!json || !json->is_array()) {
                return std::nullopt;
            }

            for (const auto& item : *json) {
                if (!item.is_object()) {
                    continue;
                }
                auto info = toClientInfo(item, "");
                // Реестр может вернуть частичные совпадения
                if (info.taxId == taxId && !info.id.empty()) {
                    return info;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[HttpClientRegistry] findClientByTaxId error: " << e.what() << std::endl;
        }

        return std::nullopt;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::ClientRegistrySettings> settings_;

    // nullopt: не отправлено или не 200
    std::optional<nlohmann::json> doGet(const std::string& path) {
        SimpleRequest request(
            "GET",
            path,
            "",
            settings_->getHost(),
            settings_->getPort(),
            {}
        );
        SimpleResponse response;

        if (!httpClient_->send(request, response)) {
            std::cerr << "[HttpClientRegistry] Request not sent: " << path << std::endl;
            return std::nullopt;
        }
        if (response.getStatus() != 200) {
            return std::nullopt;
        }
        return nlohmann::json::parse(response.getBody());
    }

    static domain::ClientInfo toClientInfo(const nlohmann::json& json, const std::string& fallbackId) {
        domain::ClientInfo info;
        info.id = readText(json, "id").value_or(fallbackId);
        info.name = readText(json, "name").value_or("");
        info.taxId = readText(json, "tax_id").value_or("");
        return info;
    }

    // Строка как есть, целое число в десятичной записи, остальное отсутствует
    static std::optional<std::string> readText(const nlohmann::json& json, const char* field) {
        auto it = json.find(field);
        if (it == json.end()) {
            return std::nullopt;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (it->is_number_integer()) {
            return std::to_string(it->get<long long>());
        }
        return std::nullopt;
    }
};

} // namespace vat::adapters::secondary
