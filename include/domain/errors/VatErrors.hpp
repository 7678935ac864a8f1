#pragma once

#include <stdexcept>
#include <string>

namespace vat::domain {

/**
 * @brief Базовое исключение движка сверки НДС
 *
 * code(): стабильный машиночитаемый код, уходит в поле "code" HTTP ответа.
 */
class VatError : public std::runtime_error {
public:
    VatError(const std::string& code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/**
 * @brief Некорректные входные данные (отклоняются до любой мутации)
 */
class ValidationError : public VatError {
public:
    explicit ValidationError(const std::string& message)
        : VatError("validation_error", message) {}

protected:
    ValidationError(const std::string& code, const std::string& message)
        : VatError(code, message) {}
};

class InvalidCreditError : public ValidationError {
public:
    explicit InvalidCreditError(const std::string& message)
        : ValidationError("invalid_credit", message) {}
};

class InvalidPeriodKeyError : public ValidationError {
public:
    explicit InvalidPeriodKeyError(const std::string& message)
        : ValidationError("invalid_period_key", message) {}
};

/**
 * @brief Итог сверки не умещается в хранимую сумму (13 цифр целой части)
 */
class AmountOutOfRangeError : public ValidationError {
public:
    explicit AmountOutOfRangeError(const std::string& message)
        : ValidationError("amount_out_of_range", message) {}
};

class NotFoundError : public VatError {
public:
    explicit NotFoundError(const std::string& message)
        : VatError("not_found", message) {}
};

/**
 * @brief Период заблокирован, изменение запрещено
 */
class LockedPeriodError : public VatError {
public:
    explicit LockedPeriodError(const std::string& message)
        : VatError("period_locked", message) {}
};

class AlreadyLockedError : public VatError {
public:
    explicit AlreadyLockedError(const std::string& message)
        : VatError("already_locked", message) {}
};

/**
 * @brief Разблокировка запрещена: более поздний период клиента уже
 *        заблокирован и мог унаследовать credit_to_next этого периода
 */
class LaterPeriodLockedError : public VatError {
public:
    explicit LaterPeriodLockedError(const std::string& message)
        : VatError("later_period_locked", message) {}
};

/**
 * @brief Ручной перенос кредита запрещён: у клиента есть заблокированный
 *        предыдущий период (обходится флагом force)
 */
class CreditOverrideNotAllowedError : public VatError {
public:
    explicit CreditOverrideNotAllowedError(const std::string& message)
        : VatError("credit_override_not_allowed", message) {}
};

/**
 * @brief Агрегатор НДС недоступен (timeout, сеть, не-200). Можно повторить.
 */
class AggregatorUnavailableError : public VatError {
public:
    explicit AggregatorUnavailableError(const std::string& message)
        : VatError("aggregator_unavailable", message) {}
};

/**
 * @brief Агрегатор ответил, но суммы некорректны (отрицательные, не парсятся)
 */
class InvalidTotalsError : public VatError {
public:
    explicit InvalidTotalsError(const std::string& message)
        : VatError("invalid_totals", message) {}
};

/**
 * @brief Запись изменена параллельно другим экземпляром сервиса
 */
class ConcurrentModificationError : public VatError {
public:
    explicit ConcurrentModificationError(const std::string& message)
        : VatError("concurrent_modification", message) {}
};

} // namespace vat::domain
