#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "PeriodKey.hpp"
#include "Reconciliation.hpp"
#include "enums/CreditSource.hpp"
#include <cstdint>
#include <optional>

namespace vat::domain {

/**
 * @brief Результат сверки НДС за один период клиента
 *
 * Одна запись на PeriodKey. Производные поля (vatDifference ... creditToNext)
 * меняются только через applyReconciliation(), вместе.
 */
class VatPeriodResult {
public:
    int64_t id = 0;  // 0: ещё не сохранена
    int64_t version = 0;  // растёт при каждой записи в хранилище
    PeriodKey key;

    Money vatOutput;
    Money vatInput;
    Money previousCredit;
    CreditSource creditSource = CreditSource::AUTO;

    Money vatDifference;
    Money finalResult;
    bool isPayable = false;
    bool isCredit = true;
    Money creditToNext;

    bool isLocked = false;
    std::optional<Timestamp> lockedAt;
    std::optional<Timestamp> lastCalculatedAt;
    Timestamp createdAt;
    Timestamp updatedAt;

    explicit VatPeriodResult(const PeriodKey& k)
        : key(k)
        , createdAt(Timestamp::now())
        , updatedAt(Timestamp::now())
    {}

    void applyReconciliation(const Reconciliation& r) {
        vatDifference = r.vatDifference;
        finalResult = r.finalResult;
        isPayable = r.isPayable;
        isCredit = r.isCredit;
        creditToNext = r.creditToNext;
    }

    void lock() {
        isLocked = true;
        lockedAt = Timestamp::now();
        updatedAt = Timestamp::now();
    }

    void unlock() {
        isLocked = false;
        lockedAt.reset();
        updatedAt = Timestamp::now();
    }
};

/**
 * @brief Результат calculate: запись + признак создания
 *
 * created не хранится в БД, сообщается вызывающему только при создании.
 */
struct CalculationResult {
    VatPeriodResult period;
    bool created = false;
};

} // namespace vat::domain
