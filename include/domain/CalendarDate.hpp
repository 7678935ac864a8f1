#pragma once

#include <string>
#include <cstdio>
#include <tuple>

namespace vat::domain {

/**
 * @brief Календарная дата без времени и часового пояса
 */
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    CalendarDate() = default;
    CalendarDate(int y, int m, int d) : year(y), month(m), day(d) {}

    static bool isLeapYear(int y) {
        return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
    }

    static int daysInMonth(int y, int m) {
        static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && isLeapYear(y)) {
            return 29;
        }
        return DAYS[m - 1];
    }

    static CalendarDate endOfMonth(int y, int m) {
        return CalendarDate(y, m, daysInMonth(y, m));
    }

    /**
     * @brief ISO формат "YYYY-MM-DD"
     */
    std::string toString() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    bool operator<(const CalendarDate& other) const {
        return std::tie(year, month, day) < std::tie(other.year, other.month, other.day);
    }

    bool operator>(const CalendarDate& other) const { return other < *this; }
    bool operator<=(const CalendarDate& other) const { return !(other < *this); }
    bool operator>=(const CalendarDate& other) const { return !(*this < other); }

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }

    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
};

/**
 * @brief Закрытый диапазон дат [from, to]
 */
struct DateRange {
    CalendarDate from;
    CalendarDate to;
};

} // namespace vat::domain
