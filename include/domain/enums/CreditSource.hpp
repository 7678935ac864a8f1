#pragma once

#include <string>

namespace vat::domain {

/**
 * @brief Откуда взят previous_credit периода
 */
enum class CreditSource {
    AUTO,   // перенесён из credit_to_next предыдущего заблокированного периода
    MANUAL  // задан вручную через set-credit
};

inline std::string toString(CreditSource source) {
    switch (source) {
        case CreditSource::AUTO: return "auto";
        case CreditSource::MANUAL: return "manual";
        default: return "unknown";
    }
}

inline CreditSource parseCreditSource(const std::string& str) {
    if (str == "manual") return CreditSource::MANUAL;
    return CreditSource::AUTO;
}

} // namespace vat::domain
