#pragma once

#include "domain/ClientInfo.hpp"
#include <optional>
#include <string>

namespace vat::ports::output {

/**
 * @brief Реестр клиентов: имя и ИНН для обогащения ответов
 *
 * Не участвует в логике сверки: записи периодов адресуются только по
 * client_id, реестр лишь переводит tax_id в client_id на входе HTTP.
 * Сбой реестра = nullopt, не ошибка.
 */
class IClientRegistry {
public:
    virtual ~IClientRegistry() = default;

    virtual std::optional<domain::ClientInfo> findClient(const std::string& clientId) = 0;

    /**
     * @brief Клиент по ИНН (для запросов, где клиент задан tax_id вместо client_id)
     */
    virtual std::optional<domain::ClientInfo> findClientByTaxId(const std::string& taxId) = 0;
};

} // namespace vat::ports::output
