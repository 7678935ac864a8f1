#pragma once

#include "ports/input/IVatPeriodService.hpp"
#include <gmock/gmock.h>

namespace vat::tests
{

class MockVatPeriodService : public ports::input::IVatPeriodService
{
public:
    MOCK_METHOD(domain::CalculationResult, calculatePeriod, (const domain::PeriodKey& key, bool recalculate), (override));
    MOCK_METHOD(domain::VatPeriodResult, recalculate, (int64_t id, bool fetchTotals), (override));
    MOCK_METHOD(domain::VatPeriodResult, setCredit, (int64_t id, const domain::Money& amount, bool force), (override));
    MOCK_METHOD(domain::VatPeriodResult, resetCredit, (int64_t id), (override));
    MOCK_METHOD(domain::VatPeriodResult, lock, (int64_t id), (override));
    MOCK_METHOD(domain::VatPeriodResult, unlock, (int64_t id), (override));
    MOCK_METHOD(std::optional<domain::VatPeriodResult>, getPeriod, (int64_t id), (override));
    MOCK_METHOD(std::vector<domain::VatPeriodResult>, listPeriods, (const domain::PeriodFilter& filter), (override));
};

/**
 * @brief Рассчитанный период для ответов мока
 */
inline domain::VatPeriodResult makePeriod(
    int64_t id,
    const std::string& clientId = "client-1",
    domain::PeriodType type = domain::PeriodType::MONTHLY,
    int year = 2025,
    int period = 3)
{
    domain::VatPeriodResult result(domain::PeriodKey(clientId, type, year, period));
    result.id = id;
    result.vatOutput = domain::Money::fromString("1000.00");
    result.vatInput = domain::Money::fromString("400.00");
    result.vatDifference = domain::Money::fromString("600.00");
    result.finalResult = domain::Money::fromString("600.00");
    result.isPayable = true;
    result.isCredit = false;
    return result;
}

} // namespace vat::tests
