#pragma once

#include <string>

namespace vat::domain {

/**
 * @brief Данные клиента из внешнего реестра (только для обогащения ответов)
 */
struct ClientInfo {
    std::string id;
    std::string name;
    std::string taxId;
};

} // namespace vat::domain
