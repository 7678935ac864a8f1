#pragma once

#include "domain/Money.hpp"
#include "domain/Reconciliation.hpp"

namespace vat::application {

/**
 * @brief Расчёт итогового НДС за период
 *
 * Чистая функция без I/O:
 * - vat_difference = vat_output - vat_input
 * - final_result   = vat_difference - previous_credit
 * - is_payable     = final_result > 0, is_credit = !is_payable
 * - credit_to_next = max(0, -final_result)
 *
 * Ожидает неотрицательные суммы, проверяет вызывающий (PeriodLedger).
 */
class ReconciliationCalculator {
public:
    static domain::Reconciliation reconcile(
        const domain::Money& vatOutput,
        const domain::Money& vatInput,
        const domain::Money& previousCredit);
};

} // namespace vat::application
