#include "application/PeriodLedger.hpp"
#include "application/ReconciliationCalculator.hpp"
#include "domain/errors/VatErrors.hpp"

#include <iostream>
#include <string>

namespace vat::application {

namespace {

/**
 * @brief a "ближе" к целевому периоду, чем b
 */
bool isMoreRecent(const domain::VatPeriodResult& a,
                  const domain::VatPeriodResult& b,
                  domain::PeriodType targetType)
{
    auto aEnd = a.key.endDate();
    auto bEnd = b.key.endDate();
    if (aEnd != bEnd) {
        return aEnd > bEnd;
    }

    bool aSameType = a.key.type() == targetType;
    bool bSameType = b.key.type() == targetType;
    if (aSameType != bSameType) {
        return aSameType;
    }

    if (a.lockedAt && b.lockedAt) {
        return *a.lockedAt > *b.lockedAt;
    }
    return a.lockedAt.has_value();
}

void ensureStorable(const char* field, const domain::Money& amount, const domain::PeriodKey& key)
{
    if (!amount.fitsStorage()) {
        throw domain::AmountOutOfRangeError(
            std::string(field) + " " + amount.toString() + " for " + key.toString() + " exceeds 13 integer digits");
    }
}

} // namespace

PeriodLedger::PeriodLedger(
    std::shared_ptr<ports::output::IVatPeriodRepository> repository,
    std::shared_ptr<ports::output::IVatAggregator> aggregator)
    : repository_(std::move(repository))
    , aggregator_(std::move(aggregator))
{
    std::cout << "[PeriodLedger] Created" << std::endl;
}

// ============================================
// IVatPeriodService
// ============================================

domain::CalculationResult PeriodLedger::calculatePeriod(const domain::PeriodKey& key, bool recalculate)
{
    auto mutex = clientMutex(key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    auto existing = repository_->findByKey(key);
    if (existing && !recalculate) {
        return {*existing, false};
    }
    return calculateUnlocked(key, existing, true);
}

domain::VatPeriodResult PeriodLedger::recalculate(int64_t id, bool fetchTotals)
{
    auto found = loadOrThrow(id);
    auto mutex = clientMutex(found.key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    auto current = loadOrThrow(id);
    return calculateUnlocked(current.key, current, fetchTotals).period;
}

domain::VatPeriodResult PeriodLedger::setCredit(int64_t id, const domain::Money& amount, bool force)
{
    if (amount.isNegative()) {
        throw domain::InvalidCreditError("previous_credit must be non-negative, got " + amount.toString());
    }

    auto found = loadOrThrow(id);
    auto mutex = clientMutex(found.key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    auto current = loadOrThrow(id);
    ensureUnlocked(current);

    if (!force) {
        if (auto predecessor = findPredecessor(current.key)) {
            throw domain::CreditOverrideNotAllowedError(
                "Credit for " + current.key.display() + " is carried from locked period " +
                predecessor->key.display() + "; pass force to override");
        }
    }

    current.previousCredit = amount;
    current.creditSource = domain::CreditSource::MANUAL;
    auto updated = reconcileOnly(current);
    updated = repository_->update(updated);

    std::cout << "[PeriodLedger] Manual credit " << amount.toString()
              << " set for " << updated.key.toString()
              << (force ? " (forced)" : "") << std::endl;
    return updated;
}

domain::VatPeriodResult PeriodLedger::resetCredit(int64_t id)
{
    auto found = loadOrThrow(id);
    auto mutex = clientMutex(found.key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    auto current = loadOrThrow(id);
    ensureUnlocked(current);

    current.creditSource = domain::CreditSource::AUTO;
    current.previousCredit = carryForwardUnlocked(current.key);
    auto updated = reconcileOnly(current);
    updated = repository_->update(updated);

    std::cout << "[PeriodLedger] Credit reset to auto for " << updated.key.toString()
              << ": " << updated.previousCredit.toString() << std::endl;
    return updated;
}

domain::VatPeriodResult PeriodLedger::lock(int64_t id)
{
    auto found = loadOrThrow(id);
    auto mutex = clientMutex(found.key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    auto current = loadOrThrow(id);
    if (current.isLocked) {
        throw domain::AlreadyLockedError("Period " + current.key.display() + " is already locked");
    }

    current.lock();
    current = repository_->update(current);

    std::cout << "[PeriodLedger] Locked " << current.key.toString()
              << ", credit_to_next=" << current.creditToNext.toString() << std::endl;
    return current;
}

domain::VatPeriodResult PeriodLedger::unlock(int64_t id)
{
    auto found = loadOrThrow(id);
    auto mutex = clientMutex(found.key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    auto current = loadOrThrow(id);
    if (!current.isLocked) {
        return current;
    }

    if (hasLaterLockedPeriod(current)) {
        throw domain::LaterPeriodLockedError(
            "Cannot unlock " + current.key.display() +
            ": a later period of this client is locked and may carry its credit");
    }

    current.unlock();
    current = repository_->update(current);

    std::cout << "[PeriodLedger] Unlocked " << current.key.toString() << std::endl;
    return current;
}

std::optional<domain::VatPeriodResult> PeriodLedger::getPeriod(int64_t id)
{
    return repository_->findById(id);
}

std::vector<domain::VatPeriodResult> PeriodLedger::listPeriods(const domain::PeriodFilter& filter)
{
    return repository_->findAll(filter);
}

// ============================================
// Операции по ключу
// ============================================

domain::CalculationResult PeriodLedger::getOrCreate(const domain::PeriodKey& key)
{
    auto mutex = clientMutex(key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    if (auto existing = repository_->findByKey(key)) {
        return {*existing, false};
    }

    domain::VatPeriodResult fresh(key);
    fresh.previousCredit = carryForwardUnlocked(key);
    auto stored = repository_->insert(reconcileOnly(fresh));

    std::cout << "[PeriodLedger] Created " << key.toString()
              << " with previous_credit=" << stored.previousCredit.toString() << std::endl;
    return {stored, true};
}

domain::CalculationResult PeriodLedger::calculate(const domain::PeriodKey& key, bool fetchTotals)
{
    auto mutex = clientMutex(key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    return calculateUnlocked(key, repository_->findByKey(key), fetchTotals);
}

domain::Money PeriodLedger::carryForward(const domain::PeriodKey& key)
{
    auto mutex = clientMutex(key.clientId());
    std::lock_guard<std::mutex> guard(*mutex);

    return carryForwardUnlocked(key);
}

// ============================================
// Внутренние операции
// ============================================

std::shared_ptr<std::mutex> PeriodLedger::clientMutex(const std::string& clientId)
{
    return clientLocks_.getOrCreate(clientId, []() { return std::make_shared<std::mutex>(); });
}

domain::VatPeriodResult PeriodLedger::loadOrThrow(int64_t id)
{
    auto period = repository_->findById(id);
    if (!period) {
        throw domain::NotFoundError("VAT period " + std::to_string(id) + " not found");
    }
    return *period;
}

domain::CalculationResult PeriodLedger::calculateUnlocked(
    const domain::PeriodKey& key,
    const std::optional<domain::VatPeriodResult>& existing,
    bool fetchTotals)
{
    if (existing) {
        auto updated = recompute(*existing, fetchTotals);
        updated = repository_->update(updated);

        std::cout << "[PeriodLedger] Recalculated " << key.toString()
                  << ": final_result=" << updated.finalResult.toString() << std::endl;
        return {updated, false};
    }

    // Новая запись попадает в хранилище только после успешного расчёта
    auto computed = recompute(domain::VatPeriodResult(key), fetchTotals);
    auto stored = repository_->insert(computed);

    std::cout << "[PeriodLedger] Created and calculated " << key.toString()
              << ": final_result=" << stored.finalResult.toString() << std::endl;
    return {stored, true};
}

domain::VatPeriodResult PeriodLedger::recompute(const domain::VatPeriodResult& period, bool fetchTotals)
{
    ensureUnlocked(period);

    domain::VatPeriodResult next = period;

    if (fetchTotals) {
        auto totals = aggregator_->getTotals(period.key.clientId(), period.key.dateRange());
        if (totals.outputVat.isNegative() || totals.inputVat.isNegative()) {
            throw domain::InvalidTotalsError(
                "Aggregator returned negative totals for " + period.key.toString() +
                ": output=" + totals.outputVat.toString() + " input=" + totals.inputVat.toString());
        }
        next.vatOutput = totals.outputVat;
        next.vatInput = totals.inputVat;
    }

    if (next.creditSource == domain::CreditSource::AUTO) {
        next.previousCredit = carryForwardUnlocked(period.key);
    }

    next = reconcileOnly(next);
    next.lastCalculatedAt = domain::Timestamp::now();
    return next;
}

domain::VatPeriodResult PeriodLedger::reconcileOnly(domain::VatPeriodResult period)
{
    period.applyReconciliation(ReconciliationCalculator::reconcile(
        period.vatOutput, period.vatInput, period.previousCredit));

    // Перенесённый кредит копится от периода к периоду
    ensureStorable("previous_credit", period.previousCredit, period.key);
    ensureStorable("vat_difference", period.vatDifference, period.key);
    ensureStorable("final_result", period.finalResult, period.key);
    ensureStorable("credit_to_next", period.creditToNext, period.key);

    period.updatedAt = domain::Timestamp::now();
    return period;
}

domain::Money PeriodLedger::carryForwardUnlocked(const domain::PeriodKey& key)
{
    auto predecessor = findPredecessor(key);
    if (!predecessor) {
        return domain::Money::zero();
    }
    return predecessor->creditToNext;
}

std::optional<domain::VatPeriodResult> PeriodLedger::findPredecessor(const domain::PeriodKey& key)
{
    auto start = key.startDate();
    std::optional<domain::VatPeriodResult> best;

    for (const auto& candidate : repository_->findLockedByClient(key.clientId())) {
        if (!candidate.isLocked || !(candidate.key.endDate() < start)) {
            continue;
        }
        if (!best || isMoreRecent(candidate, *best, key.type())) {
            best = candidate;
        }
    }
    return best;
}

bool PeriodLedger::hasLaterLockedPeriod(const domain::VatPeriodResult& period)
{
    auto end = period.key.endDate();
    for (const auto& candidate : repository_->findLockedByClient(period.key.clientId())) {
        if (candidate.id != period.id && candidate.isLocked && candidate.key.startDate() > end) {
            return true;
        }
    }
    return false;
}

void PeriodLedger::ensureUnlocked(const domain::VatPeriodResult& period)
{
    if (period.isLocked) {
        throw domain::LockedPeriodError("Period " + period.key.display() + " is locked");
    }
}

} // namespace vat::application
