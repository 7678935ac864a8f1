#include "application/ReconciliationCalculator.hpp"

namespace vat::application {

domain::Reconciliation ReconciliationCalculator::reconcile(
    const domain::Money& vatOutput,
    const domain::Money& vatInput,
    const domain::Money& previousCredit)
{
    domain::Reconciliation r;
    r.vatDifference = vatOutput - vatInput;
    r.finalResult = r.vatDifference - previousCredit;
    // Ноль не к уплате
    r.isPayable = r.finalResult.isPositive();
    r.isCredit = !r.isPayable;
    r.creditToNext = domain::Money::max(domain::Money::zero(), -r.finalResult);
    return r;
}

} // namespace vat::application
