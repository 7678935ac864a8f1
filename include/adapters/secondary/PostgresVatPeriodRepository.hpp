#pragma once

#include "ports/output/IVatPeriodRepository.hpp"
#include "domain/errors/VatErrors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace vat::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий периодов НДС
 *
 * Схема создаётся в sql/001_create_vat_period_results.sql, не здесь.
 * Суммы хранятся как NUMERIC(15,2) и передаются строками ("600.00"),
 * метки времени как TIMESTAMPTZ, читаются в UTC.
 *
 * Каждое изменение идёт в одной транзакции. Уникальный ключ
 * (client_id, period_type, year, period) отсекает дубликат, вставленный
 * параллельно другим экземпляром сервиса. UPDATE условный по столбцу
 * version: запись, прочитанная до чужого lock или пересчёта, не ляжет
 * поверх него.
 */
class PostgresVatPeriodRepository : public ports::output::IVatPeriodRepository {
public:
    explicit PostgresVatPeriodRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        // Проверяем соединение, но не создаём таблицу
        pqxx::connection conn(settings_->getConnectionString());
        std::cout << "[PostgresVatPeriodRepository] Connected to " << settings_->getName() << std::endl;
    }

    std::optional<domain::VatPeriodResult> findById(int64_t id) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(SELECT_COLUMNS + " WHERE id = $1", id);
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToPeriod(result[0]);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresVatPeriodRepository] findById error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::VatPeriodResult> findByKey(const domain::PeriodKey& key) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT_COLUMNS +
                " WHERE client_id = $1 AND period_type = $2 AND year = $3 AND period = $4",
                key.clientId(), domain::toString(key.type()), key.year(), key.period());
            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }
            return rowToPeriod(result[0]);
        } catch (const std::exception& e) {
            std::cerr << "[PostgresVatPeriodRepository] findByKey error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::VatPeriodResult> findLockedByClient(const std::string& clientId) override {
        std::vector<domain::VatPeriodResult> periods;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT_COLUMNS + " WHERE client_id = $1 AND is_locked = TRUE", clientId);
            txn.commit();

            for (const auto& row : result) {
                periods.push_back(rowToPeriod(row));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresVatPeriodRepository] findLockedByClient error: " << e.what() << std::endl;
            throw;
        }

        return periods;
    }

    std::vector<domain::VatPeriodResult> findAll(const domain::PeriodFilter& filter) override {
        std::vector<domain::VatPeriodResult> periods;

        std::optional<std::string> periodType;
        if (filter.periodType) {
            periodType = domain::toString(*filter.periodType);
        }

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                SELECT_COLUMNS +
                " WHERE ($1::text IS NULL OR client_id = $1)"
                " AND ($2::text IS NULL OR period_type = $2)"
                " AND ($3::int IS NULL OR year = $3)"
                " ORDER BY year DESC, period DESC, id",
                filter.clientId, periodType, filter.year);
            txn.commit();

            for (const auto& row : result) {
                periods.push_back(rowToPeriod(row));
            }
        } catch (const std::exception& e) {
            std::cerr << "[PostgresVatPeriodRepository] findAll error: " << e.what() << std::endl;
            throw;
        }

        return periods;
    }

    domain::VatPeriodResult insert(const domain::VatPeriodResult& period) override {
        pqxx::result result;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            result = txn.exec_params(
                "INSERT INTO vat_period_results ("
                "client_id, period_type, year, period, "
                "vat_output, vat_input, previous_credit, credit_source, "
                "vat_difference, final_result, is_payable, is_credit, credit_to_next, "
                "is_locked, locked_at, last_calculated_at, created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, $18) "
                "ON CONFLICT (client_id, period_type, year, period) DO NOTHING "
                "RETURNING id",
                period.key.clientId(),
                domain::toString(period.key.type()),
                period.key.year(),
                period.key.period(),
                period.vatOutput.toString(),
                period.vatInput.toString(),
                period.previousCredit.toString(),
                domain::toString(period.creditSource),
                period.vatDifference.toString(),
                period.finalResult.toString(),
                period.isPayable,
                period.isCredit,
                period.creditToNext.toString(),
                period.isLocked,
                optionalTimestamp(period.lockedAt),
                optionalTimestamp(period.lastCalculatedAt),
                period.createdAt.toString(),
                period.updatedAt.toString());
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresVatPeriodRepository] insert error: " << e.what() << std::endl;
            throw;
        }

        if (result.empty()) {
            throw domain::ConcurrentModificationError(
                "Period " + period.key.toString() + " was created concurrently");
        }

        domain::VatPeriodResult stored = period;
        stored.id = result[0]["id"].as<int64_t>();
        stored.version = 0;
        std::cout << "[PostgresVatPeriodRepository] Inserted " << period.key.toString()
                  << " id=" << stored.id << std::endl;
        return stored;
    }

    domain::VatPeriodResult update(const domain::VatPeriodResult& period) override {
        pqxx::result result;
        bool exists = true;

        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            // Пишем только поверх той версии, что была прочитана
            result = txn.exec_params(
                "UPDATE vat_period_results SET "
                "vat_output = $2, vat_input = $3, previous_credit = $4, credit_source = $5, "
                "vat_difference = $6, final_result = $7, is_payable = $8, is_credit = $9, "
                "credit_to_next = $10, is_locked = $11, locked_at = $12, "
                "last_calculated_at = $13, updated_at = $14, version = version + 1 "
                "WHERE id = $1 AND version = $15 "
                "RETURNING version",
                period.id,
                period.vatOutput.toString(),
                period.vatInput.toString(),
                period.previousCredit.toString(),
                domain::toString(period.creditSource),
                period.vatDifference.toString(),
                period.finalResult.toString(),
                period.isPayable,
                period.isCredit,
                period.creditToNext.toString(),
                period.isLocked,
                optionalTimestamp(period.lockedAt),
                optionalTimestamp(period.lastCalculatedAt),
                period.updatedAt.toString(),
                period.version);

            if (result.empty()) {
                exists = !txn.exec_params("SELECT 1 FROM vat_period_results WHERE id = $1", period.id).empty();
            }
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresVatPeriodRepository] update error: " << e.what() << std::endl;
            throw;
        }

        if (!exists) {
            throw domain::NotFoundError("VAT period " + std::to_string(period.id) + " not found");
        }
        if (result.empty()) {
            std::cerr << "[PostgresVatPeriodRepository] Stale write rejected for " << period.key.toString()
                      << " version=" << period.version << std::endl;
            throw domain::ConcurrentModificationError(
                "Period " + period.key.toString() + " was modified concurrently");
        }

        domain::VatPeriodResult stored = period;
        stored.version = result[0]["version"].as<int64_t>();
        return stored;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    inline static const std::string SELECT_COLUMNS =
        "SELECT id, version, client_id, period_type, year, period, "
        "vat_output::text AS vat_output, vat_input::text AS vat_input, "
        "previous_credit::text AS previous_credit, credit_source, "
        "vat_difference::text AS vat_difference, final_result::text AS final_result, "
        "is_payable, is_credit, credit_to_next::text AS credit_to_next, is_locked, "
        "to_char(locked_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"') AS locked_at, "
        "to_char(last_calculated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"') AS last_calculated_at, "
        "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"') AS created_at, "
        "to_char(updated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"') AS updated_at "
        "FROM vat_period_results";

    static std::optional<std::string> optionalTimestamp(const std::optional<domain::Timestamp>& ts) {
        if (!ts) {
            return std::nullopt;
        }
        return ts->toString();
    }

    static std::optional<domain::Timestamp> readTimestamp(const pqxx::row& row, const char* column) {
        if (row[column].is_null()) {
            return std::nullopt;
        }
        return domain::Timestamp::fromString(row[column].as<std::string>());
    }

    static domain::VatPeriodResult rowToPeriod(const pqxx::row& row) {
        auto typeStr = row["period_type"].as<std::string>();
        auto type = domain::parsePeriodType(typeStr);
        if (!type) {
            throw std::runtime_error("Unknown period_type in database: " + typeStr);
        }

        domain::PeriodKey key(
            row["client_id"].as<std::string>(),
            *type,
            row["year"].as<int>(),
            row["period"].as<int>());

        domain::VatPeriodResult period(key);
        period.id = row["id"].as<int64_t>();
        period.version = row["version"].as<int64_t>();
        period.vatOutput = domain::Money::fromString(row["vat_output"].as<std::string>());
        period.vatInput = domain::Money::fromString(row["vat_input"].as<std::string>());
        period.previousCredit = domain::Money::fromString(row["previous_credit"].as<std::string>());
        period.creditSource = domain::parseCreditSource(row["credit_source"].as<std::string>());
        period.vatDifference = domain::Money::fromString(row["vat_difference"].as<std::string>());
        period.finalResult = domain::Money::fromString(row["final_result"].as<std::string>());
        period.isPayable = row["is_payable"].as<bool>();
        period.isCredit = row["is_credit"].as<bool>();
        period.creditToNext = domain::Money::fromString(row["credit_to_next"].as<std::string>());
        period.isLocked = row["is_locked"].as<bool>();
        period.lockedAt = readTimestamp(row, "locked_at");
        period.lastCalculatedAt = readTimestamp(row, "last_calculated_at");
        period.createdAt = *readTimestamp(row, "created_at");
        period.updatedAt = *readTimestamp(row, "updated_at");
        return period;
    }
};

} // namespace vat::adapters::secondary
