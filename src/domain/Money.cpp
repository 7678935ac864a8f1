#include "domain/Money.hpp"
#include "domain/errors/VatErrors.hpp"

#include <cctype>
#include <cmath>

namespace vat::domain {

namespace {

// NUMERIC(15,2): 13 цифр целой части
constexpr int MAX_INTEGER_DIGITS = 13;
constexpr double MAX_ABS_VALUE = 1e13;
constexpr int64_t MAX_ABS_CENTS = 1000000000000000;

} // namespace

Money Money::fromString(const std::string& text)
{
    if (text.empty()) {
        throw ValidationError("Amount is empty");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = (text[pos] == '-');
        ++pos;
    }
    const size_t integerStart = pos;

    int64_t units = 0;
    int integerDigits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        // ведущие нули не считаем в лимит разрядов
        if (integerDigits > 0 || text[pos] != '0') {
            ++integerDigits;
        }
        if (integerDigits > MAX_INTEGER_DIGITS) {
            throw ValidationError("Amount is too large: " + text);
        }
        units = units * 10 + (text[pos] - '0');
        ++pos;
    }
    bool hasIntegerPart = pos > integerStart;

    int64_t fraction = 0;
    int fractionDigits = 0;
    bool hasFraction = false;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            hasFraction = true;
            // Всё после второго знака отбрасывается (усечение к нулю)
            if (fractionDigits < 2) {
                fraction = fraction * 10 + (text[pos] - '0');
                ++fractionDigits;
            }
            ++pos;
        }
    }

    if (pos != text.size() || (!hasIntegerPart && !hasFraction)) {
        throw ValidationError("Invalid amount: " + text);
    }

    while (fractionDigits < 2) {
        fraction *= 10;
        ++fractionDigits;
    }

    int64_t cents = units * 100 + fraction;
    return fromCents(negative ? -cents : cents);
}

Money Money::fromDouble(double value)
{
    if (!std::isfinite(value)) {
        throw ValidationError("Amount must be a finite number");
    }
    if (std::fabs(value) >= MAX_ABS_VALUE) {
        throw ValidationError("Amount is too large");
    }
    return fromCents(static_cast<int64_t>(std::llround(value * 100.0)));
}

bool Money::fitsStorage() const
{
    return cents_ > -MAX_ABS_CENTS && cents_ < MAX_ABS_CENTS;
}

std::string Money::toString() const
{
    int64_t absCents = cents_ < 0 ? -cents_ : cents_;
    std::string fraction = std::to_string(absCents % 100);
    if (fraction.size() < 2) {
        fraction = "0" + fraction;
    }
    std::string result = std::to_string(absCents / 100) + "." + fraction;
    return cents_ < 0 ? "-" + result : result;
}

} // namespace vat::domain
