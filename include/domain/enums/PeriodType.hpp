#pragma once

#include <string>
#include <optional>

namespace vat::domain {

enum class PeriodType {
    MONTHLY,
    QUARTERLY
};

inline std::string toString(PeriodType type) {
    switch (type) {
        case PeriodType::MONTHLY: return "monthly";
        case PeriodType::QUARTERLY: return "quarterly";
        default: return "unknown";
    }
}

/**
 * @brief Разбор типа периода; nullopt для неизвестного значения
 */
inline std::optional<PeriodType> parsePeriodType(const std::string& str) {
    if (str == "monthly") return PeriodType::MONTHLY;
    if (str == "quarterly") return PeriodType::QUARTERLY;
    return std::nullopt;
}

} // namespace vat::domain
