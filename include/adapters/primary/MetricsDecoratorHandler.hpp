#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <iostream>
#include <string>

namespace vat::adapters::primary
{

    /**
     * @brief Декоратор для подсчёта HTTP метрик
     *
     * Оборачивает любой IHttpHandler и после обработки инкрементирует
     * http_requests_total{method="...",path="...",status="..."}.
     *
     * Path нормализуется, чтобы id не размножал метрики:
     * - /api/v1/vat/periods/42 -> /api/v1/vat/periods/{id}
     * - /api/v1/vat/periods/42/lock -> /api/v1/vat/periods/{id}/lock
     */
    class MetricsDecoratorHandler : public IHttpHandler
    {
    public:
        MetricsDecoratorHandler(
            std::shared_ptr<IHttpHandler> inner,
            std::shared_ptr<ports::input::IMetricsService> metrics) : inner_(std::move(inner)), metrics_(std::move(metrics))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            inner_->handle(req, res);

            metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                        {"path", normalizePath(req.getPath())},
                                                        {"status", std::to_string(res.getStatus())}});
        }

        static std::string normalizePath(const std::string &path)
        {
            static const std::string PERIODS = "/api/v1/vat/periods/";

            std::string cleanPath = path.substr(0, path.find('?'));

            if (cleanPath.compare(0, PERIODS.size(), PERIODS) != 0)
            {
                return cleanPath;
            }

            std::string rest = cleanPath.substr(PERIODS.size());
            auto slash = rest.find('/');
            if (slash == std::string::npos)
            {
                return PERIODS + "{id}";
            }
            return PERIODS + "{id}" + rest.substr(slash);
        }

    private:
        std::shared_ptr<IHttpHandler> inner_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;
    };

} // namespace vat::adapters::primary
