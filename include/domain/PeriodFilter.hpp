#pragma once

#include "enums/PeriodType.hpp"
#include <optional>
#include <string>

namespace vat::domain {

/**
 * @brief Фильтр списка периодов (все поля опциональны)
 */
struct PeriodFilter {
    std::optional<std::string> clientId;
    std::optional<PeriodType> periodType;
    std::optional<int> year;
};

} // namespace vat::domain
