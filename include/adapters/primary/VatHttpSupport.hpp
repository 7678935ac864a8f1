#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/VatPeriodResult.hpp"
#include "domain/ClientInfo.hpp"
#include "domain/errors/VatErrors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <iostream>
#include <optional>
#include <string>

namespace vat::adapters::primary::http {

constexpr int RETRY_AFTER_SECONDS = 5;

// ============================================
// ОШИБКИ
// ============================================

inline void sendError(IResponse& res, int status, const std::string& message, const std::string& code)
{
    nlohmann::json error;
    error["error"] = message;
    error["code"] = code;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief HTTP статус для доменной ошибки
 */
inline int statusFor(const domain::VatError& e)
{
    if (dynamic_cast<const domain::ValidationError*>(&e)) return 400;
    if (dynamic_cast<const domain::NotFoundError*>(&e)) return 404;
    if (dynamic_cast<const domain::LockedPeriodError*>(&e) ||
        dynamic_cast<const domain::AlreadyLockedError*>(&e) ||
        dynamic_cast<const domain::LaterPeriodLockedError*>(&e) ||
        dynamic_cast<const domain::CreditOverrideNotAllowedError*>(&e) ||
        dynamic_cast<const domain::ConcurrentModificationError*>(&e)) return 409;
    if (dynamic_cast<const domain::InvalidTotalsError*>(&e)) return 502;
    if (dynamic_cast<const domain::AggregatorUnavailableError*>(&e)) return 503;
    return 500;
}

/**
 * @brief Ответ на доменную ошибку: {"error", "code"}
 *
 * 503 дополнительно несёт "retryable": true и заголовок Retry-After.
 */
inline void sendVatError(IResponse& res, const domain::VatError& e)
{
    int status = statusFor(e);

    nlohmann::json error;
    error["error"] = e.what();
    error["code"] = e.code();

    if (status == 503) {
        error["retryable"] = true;
        res.setResult(status, "application/json", error.dump());
        res.setHeader("Retry-After", std::to_string(RETRY_AFTER_SECONDS));
        return;
    }

    res.setResult(status, "application/json", error.dump());
}

inline void sendInternalError(IResponse& res, const std::string& component, const std::exception& e)
{
    std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
    sendError(res, 500, "Internal server error", "internal_error");
}

// ============================================
// РАЗБОР ВХОДНЫХ ДАННЫХ
// ============================================

/**
 * @brief Положительный целый id из строки; nullopt для мусора
 */
inline std::optional<int64_t> parseId(const std::string& text)
{
    if (text.empty() || text.size() > 18) {
        return std::nullopt;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    int64_t id = std::stoll(text);
    if (id <= 0) {
        return std::nullopt;
    }
    return id;
}

/**
 * @brief Целое из query параметра
 * @throws ValidationError
 */
inline int parseIntParam(const std::string& name, const std::string& text)
{
    if (text.empty()) {
        throw domain::ValidationError(name + " is required");
    }
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::exception&) {
        throw domain::ValidationError(name + " must be an integer, got '" + text + "'");
    }
    if (pos != text.size()) {
        throw domain::ValidationError(name + " must be an integer, got '" + text + "'");
    }
    return value;
}

inline bool isTruthy(const std::string& text)
{
    return text == "true" || text == "1" || text == "yes";
}

/**
 * @brief Денежная сумма из JSON: строка "120.50" или число 120.5
 * @throws ValidationError
 */
inline domain::Money parseMoney(const nlohmann::json& value, const std::string& field)
{
    if (value.is_string()) {
        return domain::Money::fromString(value.get<std::string>());
    }
    if (value.is_number()) {
        return domain::Money::fromDouble(value.get<double>());
    }
    throw domain::ValidationError(field + " must be a decimal string or a number");
}

/**
 * @brief Тело запроса как JSON объект; пустое тело = {}
 * @throws ValidationError
 */
inline nlohmann::json parseBody(const std::string& body)
{
    if (body.empty()) {
        return nlohmann::json::object();
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        throw domain::ValidationError("Invalid JSON body");
    }
    if (!json.is_object()) {
        throw domain::ValidationError("Request body must be a JSON object");
    }
    return json;
}

inline bool boolField(const nlohmann::json& body, const std::string& field, bool defaultValue)
{
    if (!body.contains(field)) {
        return defaultValue;
    }
    if (!body[field].is_boolean()) {
        throw domain::ValidationError(field + " must be a boolean");
    }
    return body[field].get<bool>();
}

// ============================================
// СЕРИАЛИЗАЦИЯ
// ============================================

inline nlohmann::json periodToJson(
    const domain::VatPeriodResult& period,
    const std::optional<domain::ClientInfo>& client = std::nullopt)
{
    const auto& key = period.key;

    nlohmann::json j;
    j["id"] = period.id;
    j["client_id"] = key.clientId();
    j["period_type"] = domain::toString(key.type());
    j["year"] = key.year();
    j["period"] = key.period();
    j["period_display"] = key.display();
    j["period_start_date"] = key.startDate().toString();
    j["period_end_date"] = key.endDate().toString();
    j["months_in_period"] = key.monthsInPeriod();

    j["vat_output"] = period.vatOutput.toString();
    j["vat_input"] = period.vatInput.toString();
    j["vat_difference"] = period.vatDifference.toString();
    j["previous_credit"] = period.previousCredit.toString();
    j["credit_source"] = domain::toString(period.creditSource);
    j["final_result"] = period.finalResult.toString();
    j["credit_to_next"] = period.creditToNext.toString();
    j["is_payable"] = period.isPayable;
    j["is_credit"] = period.isCredit;

    j["is_locked"] = period.isLocked;
    j["locked_at"] = period.lockedAt ? nlohmann::json(period.lockedAt->toString()) : nlohmann::json(nullptr);
    j["last_calculated_at"] = period.lastCalculatedAt
        ? nlohmann::json(period.lastCalculatedAt->toString())
        : nlohmann::json(nullptr);
    j["created_at"] = period.createdAt.toString();
    j["updated_at"] = period.updatedAt.toString();

    if (client) {
        j["client_name"] = client->name;
        j["client_tax_id"] = client->taxId;
    }
    return j;
}

} // namespace vat::adapters::primary::http
