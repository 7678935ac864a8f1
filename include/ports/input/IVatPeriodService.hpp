#pragma once

#include "domain/VatPeriodResult.hpp"
#include "domain/PeriodKey.hpp"
#include "domain/PeriodFilter.hpp"
#include "domain/Money.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace vat::ports::input {

/**
 * @brief Интерфейс сервиса сверки НДС по периодам
 *
 * Ошибки сообщаются исключениями из domain/errors/VatErrors.hpp.
 */
class IVatPeriodService {
public:
    virtual ~IVatPeriodService() = default;

    /**
     * @brief Получить (или создать) период и при необходимости пересчитать
     *
     * Новый период всегда рассчитывается с запросом итогов у агрегатора.
     * Существующий пересчитывается только при recalculate = true.
     *
     * @throws InvalidPeriodKeyError, LockedPeriodError, AggregatorUnavailableError
     */
    virtual domain::CalculationResult calculatePeriod(const domain::PeriodKey& key, bool recalculate) = 0;

    /**
     * @brief Пересчитать существующий период
     * @param fetchTotals запросить свежие итоги у агрегатора
     */
    virtual domain::VatPeriodResult recalculate(int64_t id, bool fetchTotals) = 0;

    /**
     * @brief Задать previous_credit вручную
     * @param force разрешить при наличии заблокированного предыдущего периода
     */
    virtual domain::VatPeriodResult setCredit(int64_t id, const domain::Money& amount, bool force) = 0;

    /**
     * @brief Вернуть previous_credit к автоматическому переносу
     */
    virtual domain::VatPeriodResult resetCredit(int64_t id) = 0;

    virtual domain::VatPeriodResult lock(int64_t id) = 0;

    virtual domain::VatPeriodResult unlock(int64_t id) = 0;

    virtual std::optional<domain::VatPeriodResult> getPeriod(int64_t id) = 0;

    /**
     * @brief Список периодов, сортировка: год desc, период desc
     */
    virtual std::vector<domain::VatPeriodResult> listPeriods(const domain::PeriodFilter& filter) = 0;
};

} // namespace vat::ports::input
