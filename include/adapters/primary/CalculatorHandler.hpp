#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/VatHttpSupport.hpp"
#include "ports/input/IVatPeriodService.hpp"
#include "ports/output/IClientRegistry.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <optional>

namespace vat::adapters::primary
{

    /**
     * @brief GET /api/v1/vat/calculator — расчёт периода по ключу
     *
     * Query: client_id или tax_id (client_id приоритетнее), period_type
     * (monthly по умолчанию), year, period, recalculate (true/1/yes).
     * tax_id переводится в client_id через реестр, неизвестный tax_id даёт 404.
     * Новый период создаётся и сразу рассчитывается, существующий
     * пересчитывается только при recalculate.
     */
    class CalculatorHandler : public IHttpHandler
    {
    public:
        CalculatorHandler(
            std::shared_ptr<ports::input::IVatPeriodService> service,
            std::shared_ptr<ports::output::IClientRegistry> clientRegistry)
            : service_(std::move(service)), clientRegistry_(std::move(clientRegistry))
        {
            std::cout << "[CalculatorHandler] Created" << std::endl;
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
                auto clientId = req.getQueryParam("client_id").value_or("");
                auto taxId = req.getQueryParam("tax_id").value_or("");
                std::optional<domain::ClientInfo> client;
                if (clientId.empty())
                {
                    if (taxId.empty())
                    {
                        http::sendError(res, 400, "client_id or tax_id is required", "validation_error");
                        return;
                    }
                    client = clientRegistry_->findClientByTaxId(taxId);
                    if (!client)
                    {
                        http::sendError(res, 404, "No client with tax_id " + taxId, "not_found");
                        return;
                    }
                    clientId = client->id;
                }

                auto typeStr = req.getQueryParam("period_type").value_or("monthly");
                auto type = domain::parsePeriodType(typeStr);
                if (!type)
                {
                    http::sendError(res, 400, "period_type must be 'monthly' or 'quarterly'", "invalid_period_key");
                    return;
                }

                int year = http::parseIntParam("year", req.getQueryParam("year").value_or(""));
                int period = http::parseIntParam("period", req.getQueryParam("period").value_or(""));
                bool recalculate = http::isTruthy(req.getQueryParam("recalculate").value_or(""));

                domain::PeriodKey key(clientId, *type, year, period);
                auto result = service_->calculatePeriod(key, recalculate);

                if (!client)
                {
                    client = clientRegistry_->findClient(clientId);
                }
                auto body = http::periodToJson(result.period, client);
                body["created"] = result.created;
                res.setResult(200, "application/json", body.dump());
            }
            catch (const domain::VatError &e)
            {
                std::cerr << "[CalculatorHandler] " << e.code() << ": " << e.what() << std::endl;
                http::sendVatError(res, e);
            }
            catch (const std::exception &e)
            {
                http::sendInternalError(res, "CalculatorHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IVatPeriodService> service_;
        std::shared_ptr<ports::output::IClientRegistry> clientRegistry_;
    };

} // namespace vat::adapters::primary
