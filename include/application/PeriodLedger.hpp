#pragma once

#include "ports/input/IVatPeriodService.hpp"
#include "ports/output/IVatPeriodRepository.hpp"
#include "ports/output/IVatAggregator.hpp"
#include "domain/VatPeriodResult.hpp"
#include "domain/PeriodKey.hpp"
#include "domain/Money.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vat::application {

/**
 * @brief Реестр периодов НДС: хранение, перенос кредита, блокировка
 *
 * Инварианты:
 * - одна запись на PeriodKey (create-if-absent в calculate)
 * - заблокированная запись не меняется ни пересчётом, ни set-credit
 * - новая запись сохраняется только после успешного полного расчёта
 *
 * Все операции выполняются под мьютексом клиента: операции одного клиента
 * строго последовательны, разные клиенты работают параллельно.
 * Мьютекс действует внутри процесса; между экземплярами сервиса запись
 * защищает версия строки в репозитории (устаревшая запись отвергается
 * с ConcurrentModificationError).
 *
 * Перенос кредита: берётся credit_to_next самого позднего заблокированного
 * периода клиента, закончившегося строго до начала текущего
 * (при равной дате окончания: того же типа, затем позже заблокированный).
 */
class PeriodLedger : public ports::input::IVatPeriodService {
public:
    PeriodLedger(
        std::shared_ptr<ports::output::IVatPeriodRepository> repository,
        std::shared_ptr<ports::output::IVatAggregator> aggregator);

    // ============================================
    // IVatPeriodService
    // ============================================

    domain::CalculationResult calculatePeriod(const domain::PeriodKey& key, bool recalculate) override;
    domain::VatPeriodResult recalculate(int64_t id, bool fetchTotals) override;
    domain::VatPeriodResult setCredit(int64_t id, const domain::Money& amount, bool force) override;
    domain::VatPeriodResult resetCredit(int64_t id) override;
    domain::VatPeriodResult lock(int64_t id) override;
    domain::VatPeriodResult unlock(int64_t id) override;
    std::optional<domain::VatPeriodResult> getPeriod(int64_t id) override;
    std::vector<domain::VatPeriodResult> listPeriods(const domain::PeriodFilter& filter) override;

    // ============================================
    // Операции по ключу периода
    // ============================================

    /**
     * @brief Загрузить запись или создать с нулевыми итогами и перенесённым кредитом
     *
     * Агрегатор не вызывается.
     */
    domain::CalculationResult getOrCreate(const domain::PeriodKey& key);

    /**
     * @brief Пересчитать период (создав при отсутствии)
     * @throws LockedPeriodError если период заблокирован
     */
    domain::CalculationResult calculate(const domain::PeriodKey& key, bool fetchTotals);

    /**
     * @brief credit_to_next ближайшего заблокированного предыдущего периода или 0
     */
    domain::Money carryForward(const domain::PeriodKey& key);

private:
    std::shared_ptr<ports::output::IVatPeriodRepository> repository_;
    std::shared_ptr<ports::output::IVatAggregator> aggregator_;
    ThreadSafeMap<std::string, std::mutex> clientLocks_;

    std::shared_ptr<std::mutex> clientMutex(const std::string& clientId);

    /**
     * @brief Найти запись по id (без блокировки), нужен clientId для мьютекса
     * @throws NotFoundError
     */
    domain::VatPeriodResult loadOrThrow(int64_t id);

    // Ниже только под мьютексом клиента

    domain::CalculationResult calculateUnlocked(
        const domain::PeriodKey& key,
        const std::optional<domain::VatPeriodResult>& existing,
        bool fetchTotals);

    domain::VatPeriodResult recompute(const domain::VatPeriodResult& period, bool fetchTotals);

    domain::VatPeriodResult reconcileOnly(domain::VatPeriodResult period);

    domain::Money carryForwardUnlocked(const domain::PeriodKey& key);

    std::optional<domain::VatPeriodResult> findPredecessor(const domain::PeriodKey& key);

    bool hasLaterLockedPeriod(const domain::VatPeriodResult& period);

    static void ensureUnlocked(const domain::VatPeriodResult& period);
};

} // namespace vat::application
