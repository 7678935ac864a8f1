#pragma once

#include <string>
#include <map>

namespace vat::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Только counter метрики с опциональными labels, сериализация
 * в Prometheus text format.
 *
 * @example
 * ```cpp
 * metricsService->increment("http_requests_total", {
 *     {"method", "POST"},
 *     {"path", "/api/v1/vat/periods/{id}/lock"},
 *     {"status", "409"}
 * });
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Увеличить счётчик на 1 (создаёт метрику со значением 1, если её нет)
     *
     * Ключ: "name{label1=\"value1\",label2=\"value2\"}", labels по алфавиту.
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Все метрики в Prometheus text format 0.0.4
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace vat::ports::input
