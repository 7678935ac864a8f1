#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"
#include "settings/StorageSettings.hpp"

#include <memory>
#include <iostream>
#include <string>

namespace vat::adapters::primary {

/**
 * @brief GET /metrics — счётчики сервиса и vat_service_info в Prometheus text format 0.0.4
 *
 * vat_service_info{storage="memory"|"postgres"} 1 позволяет отличить
 * экземпляры с разными хранилищами на одном дашборде.
 */
class MetricsHandler : public IHttpHandler {
public:
    MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics,
                   std::shared_ptr<settings::StorageSettings> storage)
        : metrics_(std::move(metrics))
        , storage_(std::move(storage))
    {
        std::cout << "[MetricsHandler] Created, storage " << storage_->getBackend() << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            res.setResult(405, "application/json", R"({"error":"Method not allowed","code":"method_not_allowed"})");
            res.setHeader("Allow", "GET");
            return;
        }

        std::string body = metrics_->toPrometheusFormat();
        body += "# HELP vat_service_info VAT reconciliation service instance\n";
        body += "# TYPE vat_service_info gauge\n";
        body += "vat_service_info{storage=\"";
        body += storage_->useInMemory() ? "memory" : "postgres";
        body += "\"} 1\n";

        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8");
        res.setBody(body);
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::shared_ptr<settings::StorageSettings> storage_;
};

} // namespace vat::adapters::primary
