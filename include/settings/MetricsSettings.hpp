#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace vat::settings {

/**
 * @brief Настройки метрик VAT Service
 *
 * HTTP метрики: method + нормализованный path + status.
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"}
        };
    }

    std::vector<std::string> getInitialKeys() const override {
        return {
            "http_requests_total{method=\"GET\",path=\"/health\",status=\"200\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\",status=\"200\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/vat/calculator\",status=\"200\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/vat/periods\",status=\"200\"}"
        };
    }
};

} // namespace vat::settings
