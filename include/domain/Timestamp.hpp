#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace vat::domain {

/**
 * @brief Временная метка (UTC, точность до секунды)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(now().value) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<std::chrono::seconds>(
            std::chrono::system_clock::now()));
    }

    /**
     * @brief ISO 8601 в UTC: "2025-04-20T10:15:00Z"
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        // timegm: строка в UTC, mktime интерпретировал бы её как local time
        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
        return Timestamp(tp);
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const {
        return value < other.value;
    }

    bool operator>(const Timestamp& other) const {
        return value > other.value;
    }

    bool operator==(const Timestamp& other) const {
        return value == other.value;
    }
};

} // namespace vat::domain
