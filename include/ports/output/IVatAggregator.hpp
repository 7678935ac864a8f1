#pragma once

#include "domain/VatTotals.hpp"
#include "domain/CalendarDate.hpp"
#include <string>

namespace vat::ports::output {

/**
 * @brief Источник итогов НДС (output/input) за диапазон дат
 *
 * Внешний сервис: считает итоги по загруженным документам клиента.
 */
class IVatAggregator {
public:
    virtual ~IVatAggregator() = default;

    /**
     * @throws AggregatorUnavailableError при сбое/таймауте (можно повторить)
     * @throws InvalidTotalsError если ответ не содержит корректных сумм
     */
    virtual domain::VatTotals getTotals(const std::string& clientId, const domain::DateRange& range) = 0;
};

} // namespace vat::ports::output
