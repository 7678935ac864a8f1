#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/VatHttpSupport.hpp"
#include "ports/input/IVatPeriodService.hpp"
#include "ports/output/IClientRegistry.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace vat::adapters::primary
{

    /**
     * @brief GET /api/v1/vat/periods/{id} — период по ID
     *
     * Роутер регистрирует с паттерном "/api/v1/vat/periods/*"
     */
    class GetPeriodHandler : public IHttpHandler
    {
    public:
        GetPeriodHandler(
            std::shared_ptr<ports::input::IVatPeriodService> service,
            std::shared_ptr<ports::output::IClientRegistry> clientRegistry)
            : service_(std::move(service)), clientRegistry_(std::move(clientRegistry))
        {
            std::cout << "[GetPeriodHandler] Created" << std::endl;
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
                auto id = http::parseId(req.getPathParam(0).value_or(""));
                if (!id)
                {
                    http::sendError(res, 400, "Period ID must be a positive integer", "validation_error");
                    return;
                }

                auto period = service_->getPeriod(*id);
                if (!period)
                {
                    http::sendError(res, 404, "VAT period " + std::to_string(*id) + " not found", "not_found");
                    return;
                }

                auto client = clientRegistry_->findClient(period->key.clientId());
                res.setResult(200, "application/json", http::periodToJson(*period, client).dump());
            }
            catch (const domain::VatError &e)
            {
                http::sendVatError(res, e);
            }
            catch (const std::exception &e)
            {
                http::sendInternalError(res, "GetPeriodHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IVatPeriodService> service_;
        std::shared_ptr<ports::output::IClientRegistry> clientRegistry_;
    };

} // namespace vat::adapters::primary
