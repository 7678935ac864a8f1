#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/VatHttpSupport.hpp"
#include "ports/input/IVatPeriodService.hpp"
#include "ports/output/IClientRegistry.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <vector>

namespace vat::adapters::primary
{

    /**
     * @brief GET /api/v1/vat/periods?client_id=&tax_id=&period_type=&year=
     *
     * Все фильтры опциональны. Порядок: год desc, период desc.
     * tax_id без client_id переводится в client_id через реестр;
     * неизвестный tax_id даёт пустой список.
     */
    class ListPeriodsHandler : public IHttpHandler
    {
    public:
        ListPeriodsHandler(
            std::shared_ptr<ports::input::IVatPeriodService> service,
            std::shared_ptr<ports::output::IClientRegistry> clientRegistry)
            : service_(std::move(service)), clientRegistry_(std::move(clientRegistry))
        {
            std::cout << "[ListPeriodsHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                http::sendError(res, 405, "Method not allowed", "method_not_allowed");
                return;
            }

            try
            {
                domain::PeriodFilter filter;

                auto clientId = req.getQueryParam("client_id").value_or("");
                auto taxId = req.getQueryParam("tax_id").value_or("");
                if (!clientId.empty())
                {
                    filter.clientId = clientId;
                }
                else if (!taxId.empty())
                {
                    auto client = clientRegistry_->findClientByTaxId(taxId);
                    if (!client)
                    {
                        sendPeriods(res, {});
                        return;
                    }
                    filter.clientId = client->id;
                }

                auto typeStr = req.getQueryParam("period_type").value_or("");
                if (!typeStr.empty())
                {
                    filter.periodType = domain::parsePeriodType(typeStr);
                    if (!filter.periodType)
                    {
                        http::sendError(res, 400, "period_type must be 'monthly' or 'quarterly'", "validation_error");
                        return;
                    }
                }

                auto yearStr = req.getQueryParam("year").value_or("");
                if (!yearStr.empty())
                {
                    filter.year = http::parseIntParam("year", yearStr);
                }

                sendPeriods(res, service_->listPeriods(filter));
            }
            catch (const domain::VatError &e)
            {
                http::sendVatError(res, e);
            }
            catch (const std::exception &e)
            {
                http::sendInternalError(res, "ListPeriodsHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IVatPeriodService> service_;
        std::shared_ptr<ports::output::IClientRegistry> clientRegistry_;

        static void sendPeriods(IResponse &res, const std::vector<domain::VatPeriodResult> &periods)
        {
            nlohmann::json items = nlohmann::json::array();
            for (const auto &period : periods)
            {
                items.push_back(http::periodToJson(period));
            }

            nlohmann::json response;
            response["periods"] = items;
            response["count"] = periods.size();
            res.setResult(200, "application/json", response.dump());
        }
    };

} // namespace vat::adapters::primary
