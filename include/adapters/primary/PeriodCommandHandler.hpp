#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/VatHttpSupport.hpp"
#include "ports/input/IVatPeriodService.hpp"
#include "ports/output/IClientRegistry.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <string>

namespace vat::adapters::primary
{

    /**
     * @brief POST /api/v1/vat/periods/{id}/{action} — изменения периода
     *
     * Эндпоинты:
     * - POST /api/v1/vat/periods/{id}/calculate     {"fetch_totals": bool = true}
     * - POST /api/v1/vat/periods/{id}/set-credit    {"previous_credit": decimal, "force": bool = false}
     * - POST /api/v1/vat/periods/{id}/reset-credit
     * - POST /api/v1/vat/periods/{id}/lock
     * - POST /api/v1/vat/periods/{id}/unlock
     *
     * Ответ: обновлённая запись периода.
     */
    class PeriodCommandHandler : public IHttpHandler
    {
    public:
        PeriodCommandHandler(
            std::shared_ptr<ports::input::IVatPeriodService> service,
            std::shared_ptr<ports::output::IClientRegistry> clientRegistry)
            : service_(std::move(service)), clientRegistry_(std::move(clientRegistry))
        {
            std::cout << "[PeriodCommandHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                http::sendError(res, 405, "Method not allowed", "method_not_allowed");
                return;
            }

            std::string idStr;
            std::string action;
            if (!splitPath(req.getPath(), idStr, action))
            {
                http::sendError(res, 404, "Not found", "not_found");
                return;
            }

            if (!isKnownAction(action))
            {
                http::sendError(res, 404, "Unknown action: " + action, "not_found");
                return;
            }

            auto id = http::parseId(idStr);
            if (!id)
            {
                http::sendError(res, 400, "Period ID must be a positive integer", "validation_error");
                return;
            }

            try
            {
                auto body = http::parseBody(req.getBody());
                domain::VatPeriodResult period = dispatch(*id, action, body);

                auto client = clientRegistry_->findClient(period.key.clientId());
                res.setResult(200, "application/json", http::periodToJson(period, client).dump());
            }
            catch (const domain::VatError &e)
            {
                std::cerr << "[PeriodCommandHandler] " << action << " #" << *id << " -> "
                          << e.code() << ": " << e.what() << std::endl;
                http::sendVatError(res, e);
            }
            catch (const std::exception &e)
            {
                http::sendInternalError(res, "PeriodCommandHandler", e);
            }
        }

    private:
        std::shared_ptr<ports::input::IVatPeriodService> service_;
        std::shared_ptr<ports::output::IClientRegistry> clientRegistry_;

        static bool isKnownAction(const std::string &action)
        {
            return action == "calculate" || action == "set-credit" || action == "reset-credit" ||
                   action == "lock" || action == "unlock";
        }

        domain::VatPeriodResult dispatch(int64_t id, const std::string &action, const nlohmann::json &body)
        {
            if (action == "calculate")
            {
                return service_->recalculate(id, http::boolField(body, "fetch_totals", true));
            }
            if (action == "set-credit")
            {
                if (!body.contains("previous_credit") || body["previous_credit"].is_null())
                {
                    throw domain::ValidationError("previous_credit is required");
                }
                auto amount = http::parseMoney(body["previous_credit"], "previous_credit");
                return service_->setCredit(id, amount, http::boolField(body, "force", false));
            }
            if (action == "reset-credit")
            {
                return service_->resetCredit(id);
            }
            if (action == "lock")
            {
                return service_->lock(id);
            }
            return service_->unlock(id);
        }

        /**
         * @brief "/api/v1/vat/periods/42/lock?x=y" -> ("42", "lock")
         */
        static bool splitPath(const std::string &path, std::string &id, std::string &action)
        {
            static const std::string PREFIX = "/api/v1/vat/periods/";

            std::string cleanPath = path.substr(0, path.find('?'));
            if (cleanPath.compare(0, PREFIX.size(), PREFIX) != 0)
            {
                return false;
            }

            std::string rest = cleanPath.substr(PREFIX.size());
            auto slash = rest.find('/');
            if (slash == std::string::npos)
            {
                return false;
            }

            id = rest.substr(0, slash);
            action = rest.substr(slash + 1);
            return !id.empty() && !action.empty() && action.find('/') == std::string::npos;
        }
    };

} // namespace vat::adapters::primary
