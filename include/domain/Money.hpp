#pragma once

#include <string>
#include <cstdint>

namespace vat::domain {

/**
 * @brief Денежная сумма с фиксированной точкой (два знака после запятой)
 *
 * Хранит значение в центах (int64), поэтому сложение и вычитание точные.
 * Округление до центов происходит один раз, при входе суммы в систему
 * (fromString отбрасывает лишние знаки, fromDouble округляет до цента).
 */
class Money {
public:
    Money() = default;

    static Money fromCents(int64_t cents) {
        Money m;
        m.cents_ = cents;
        return m;
    }

    static Money zero() { return Money(); }

    /**
     * @brief Разобрать десятичную строку ("1234.5", "-10.00", "7")
     * @throws ValidationError при некорректном формате или переполнении
     */
    static Money fromString(const std::string& text);

    /**
     * @brief Из JSON числа, с округлением до ближайшего цента
     * @throws ValidationError для NaN/Inf и слишком больших значений
     */
    static Money fromDouble(double value);

    int64_t cents() const { return cents_; }

    /**
     * @brief Всегда два знака после точки: "600.00", "-350.00"
     */
    std::string toString() const;

    double toDouble() const {
        return static_cast<double>(cents_) / 100.0;
    }

    /**
     * @brief Умещается в NUMERIC(15,2): по модулю меньше 10^13
     */
    bool fitsStorage() const;

    bool isNegative() const { return cents_ < 0; }
    bool isZero() const { return cents_ == 0; }
    bool isPositive() const { return cents_ > 0; }

    Money operator+(const Money& other) const { return fromCents(cents_ + other.cents_); }
    Money operator-(const Money& other) const { return fromCents(cents_ - other.cents_); }
    Money operator-() const { return fromCents(-cents_); }

    bool operator==(const Money& other) const { return cents_ == other.cents_; }
    bool operator!=(const Money& other) const { return cents_ != other.cents_; }
    bool operator<(const Money& other) const { return cents_ < other.cents_; }
    bool operator>(const Money& other) const { return cents_ > other.cents_; }
    bool operator<=(const Money& other) const { return cents_ <= other.cents_; }
    bool operator>=(const Money& other) const { return cents_ >= other.cents_; }

    static Money max(const Money& a, const Money& b) { return a < b ? b : a; }

private:
    int64_t cents_ = 0;
};

} // namespace vat::domain
