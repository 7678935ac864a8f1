#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "settings/StorageSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace vat::adapters::primary {

/**
 * @brief GET /health — liveness и выбранное хранилище периодов
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<settings::StorageSettings> storage)
        : storage_(std::move(storage)) {}

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            res.setResult(405, "application/json", R"({"error":"Method not allowed","code":"method_not_allowed"})");
            return;
        }

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "vat-service";
        response["version"] = "1.0.0";
        response["storage"] = storage_->useInMemory() ? "memory" : "postgres";

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::StorageSettings> storage_;
};

} // namespace vat::adapters::primary
