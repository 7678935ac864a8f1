#pragma once

#include <string>
#include <vector>

namespace vat::settings {

/**
 * @brief Определение метрики для Prometheus (HELP и TYPE)
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "http_requests_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge", "histogram"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * getInitialKeys(): ключи, которые публикуются с нуля ещё до первого
 * инкремента. Ключи, появившиеся позже (например, с новым status),
 * добавляются динамически.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    virtual std::vector<std::string> getInitialKeys() const = 0;
};

} // namespace vat::settings
