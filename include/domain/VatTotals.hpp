#pragma once

#include "Money.hpp"

namespace vat::domain {

/**
 * @brief Итоги НДС за диапазон дат от агрегатора
 */
struct VatTotals {
    Money outputVat;  // НДС с продаж
    Money inputVat;   // НДС с покупок (к вычету)
};

} // namespace vat::domain
