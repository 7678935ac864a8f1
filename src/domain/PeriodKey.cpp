#include "domain/PeriodKey.hpp"
#include "domain/errors/VatErrors.hpp"

#include <cstdio>
#include <utility>

namespace vat::domain {

PeriodKey::PeriodKey(std::string clientId, PeriodType type, int year, int period)
    : clientId_(std::move(clientId))
    , type_(type)
    , year_(year)
    , period_(period)
{
    if (clientId_.empty()) {
        throw InvalidPeriodKeyError("client_id is required");
    }
    if (clientId_.size() > MAX_CLIENT_ID_LENGTH) {
        throw InvalidPeriodKeyError("client_id is too long");
    }
    if (year_ < MIN_YEAR || year_ > MAX_YEAR) {
        throw InvalidPeriodKeyError("year out of range: " + std::to_string(year_));
    }

    int maxPeriod = (type_ == PeriodType::MONTHLY) ? 12 : 4;
    if (period_ < 1 || period_ > maxPeriod) {
        throw InvalidPeriodKeyError("period out of range for " + domain::toString(type_) +
                                    ": " + std::to_string(period_));
    }
}

int PeriodKey::firstMonth() const
{
    return (type_ == PeriodType::MONTHLY) ? period_ : (period_ - 1) * 3 + 1;
}

int PeriodKey::lastMonth() const
{
    return (type_ == PeriodType::MONTHLY) ? period_ : period_ * 3;
}

CalendarDate PeriodKey::startDate() const
{
    return CalendarDate(year_, firstMonth(), 1);
}

CalendarDate PeriodKey::endDate() const
{
    return CalendarDate::endOfMonth(year_, lastMonth());
}

std::vector<int> PeriodKey::monthsInPeriod() const
{
    std::vector<int> months;
    for (int m = firstMonth(); m <= lastMonth(); ++m) {
        months.push_back(m);
    }
    return months;
}

std::string PeriodKey::display() const
{
    char buf[16];
    if (type_ == PeriodType::QUARTERLY) {
        std::snprintf(buf, sizeof(buf), "Q%d %04d", period_, year_);
    } else {
        std::snprintf(buf, sizeof(buf), "%02d/%04d", period_, year_);
    }
    return buf;
}

std::string PeriodKey::toString() const
{
    return clientId_ + ":" + domain::toString(type_) + ":" +
           std::to_string(year_) + ":" + std::to_string(period_);
}

} // namespace vat::domain
