#pragma once

#include "CalendarDate.hpp"
#include "enums/PeriodType.hpp"
#include <string>
#include <vector>

namespace vat::domain {

/**
 * @brief Ключ периода сверки: (клиент, тип периода, год, номер периода)
 *
 * Неизменяемое значение. Конструктор проверяет инварианты и бросает
 * InvalidPeriodKeyError:
 * - clientId непустой, не длиннее 64 символов
 * - year в диапазоне [1900, 2999]
 * - period 1..12 для MONTHLY, 1..4 для QUARTERLY
 */
class PeriodKey {
public:
    static constexpr int MIN_YEAR = 1900;
    static constexpr int MAX_YEAR = 2999;
    static constexpr size_t MAX_CLIENT_ID_LENGTH = 64;

    PeriodKey(std::string clientId, PeriodType type, int year, int period);

    const std::string& clientId() const { return clientId_; }
    PeriodType type() const { return type_; }
    int year() const { return year_; }
    int period() const { return period_; }

    CalendarDate startDate() const;
    CalendarDate endDate() const;
    DateRange dateRange() const { return {startDate(), endDate()}; }

    /**
     * @brief Месяцы, входящие в период (1..12)
     */
    std::vector<int> monthsInPeriod() const;

    /**
     * @brief "03/2025" для месячного периода, "Q1 2025" для квартального
     */
    std::string display() const;

    /**
     * @brief Каноническая строка "client:monthly:2025:3" (логи, ключи карт)
     */
    std::string toString() const;

    bool operator==(const PeriodKey& other) const {
        return clientId_ == other.clientId_ && type_ == other.type_ &&
               year_ == other.year_ && period_ == other.period_;
    }

    bool operator!=(const PeriodKey& other) const { return !(*this == other); }

private:
    std::string clientId_;
    PeriodType type_;
    int year_;
    int period_;

    int firstMonth() const;
    int lastMonth() const;
};

} // namespace vat::domain
