#pragma once

#include "Money.hpp"

namespace vat::domain {

/**
 * @brief Производные поля сверки НДС за период
 */
struct Reconciliation {
    Money vatDifference;   // vat_output - vat_input
    Money finalResult;     // vat_difference - previous_credit
    bool isPayable = false;
    bool isCredit = true;
    Money creditToNext;    // max(0, -final_result)
};

} // namespace vat::domain
