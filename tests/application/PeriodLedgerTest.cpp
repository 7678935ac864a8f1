/**
 * @file PeriodLedgerTest.cpp
 * @brief Unit-тесты для PeriodLedger
 *
 * Реальный InMemoryVatPeriodRepository + mock агрегатора.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/PeriodLedger.hpp"
#include "adapters/secondary/InMemoryVatPeriodRepository.hpp"
#include "domain/errors/VatErrors.hpp"
#include "../mocks/MockVatAggregator.hpp"

using namespace vat;
using namespace vat::application;
using namespace vat::tests;
using domain::Money;
using domain::PeriodKey;
using domain::PeriodType;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class PeriodLedgerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        repository_ = std::make_shared<adapters::secondary::InMemoryVatPeriodRepository>();
        aggregator_ = std::make_shared<MockVatAggregator>();
        ledger_ = std::make_shared<PeriodLedger>(repository_, aggregator_);
    }

    static PeriodKey monthly(int month, int year = 2025, const std::string &clientId = "client-1")
    {
        return PeriodKey(clientId, PeriodType::MONTHLY, year, month);
    }

    static PeriodKey quarterly(int quarter, int year = 2025, const std::string &clientId = "client-1")
    {
        return PeriodKey(clientId, PeriodType::QUARTERLY, year, quarter);
    }

    /**
     * @brief Создать и рассчитать период с заданными итогами
     */
    domain::VatPeriodResult calculated(const PeriodKey &key, const std::string &out, const std::string &in)
    {
        EXPECT_CALL(*aggregator_, getTotals(key.clientId(), _))
            .WillOnce(Return(makeTotals(out, in)))
            .RetiresOnSaturation();
        return ledger_->calculatePeriod(key, true).period;
    }

    std::shared_ptr<adapters::secondary::InMemoryVatPeriodRepository> repository_;
    std::shared_ptr<MockVatAggregator> aggregator_;
    std::shared_ptr<PeriodLedger> ledger_;
};

// ============================================================================
// ТЕСТЫ: calculatePeriod
// ============================================================================

TEST_F(PeriodLedgerTest, CalculatePeriod_NewPeriod_CreatesAndReconciles)
{
    EXPECT_CALL(*aggregator_, getTotals("client-1", _))
        .WillOnce(Return(makeTotals("1000.00", "400.00")));

    auto result = ledger_->calculatePeriod(monthly(3), false);

    EXPECT_TRUE(result.created);
    EXPECT_GT(result.period.id, 0);
    EXPECT_EQ(result.period.vatOutput.toString(), "1000.00");
    EXPECT_EQ(result.period.vatInput.toString(), "400.00");
    EXPECT_EQ(result.period.previousCredit.toString(), "0.00");
    EXPECT_EQ(result.period.vatDifference.toString(), "600.00");
    EXPECT_EQ(result.period.finalResult.toString(), "600.00");
    EXPECT_TRUE(result.period.isPayable);
    EXPECT_FALSE(result.period.isCredit);
    EXPECT_EQ(result.period.creditToNext.toString(), "0.00");
    EXPECT_TRUE(result.period.lastCalculatedAt.has_value());
    EXPECT_EQ(repository_->count(), 1u);
}

TEST_F(PeriodLedgerTest, CalculatePeriod_PassesPeriodDateRangeToAggregator)
{
    EXPECT_CALL(*aggregator_, getTotals("client-1", _))
        .WillOnce(Invoke([](const std::string &, const domain::DateRange &range) {
            EXPECT_EQ(range.from.toString(), "2025-04-01");
            EXPECT_EQ(range.to.toString(), "2025-06-30");
            return makeTotals("0", "0");
        }));

    ledger_->calculatePeriod(quarterly(2), false);
}

TEST_F(PeriodLedgerTest, CalculatePeriod_Existing_WithoutRecalculate_ReturnsStored)
{
    auto first = calculated(monthly(3), "1000.00", "400.00");

    EXPECT_CALL(*aggregator_, getTotals(_, _)).Times(0);
    auto second = ledger_->calculatePeriod(monthly(3), false);

    EXPECT_FALSE(second.created);
    EXPECT_EQ(second.period.id, first.id);
    EXPECT_EQ(second.period.finalResult, first.finalResult);
    EXPECT_EQ(repository_->count(), 1u);
}

TEST_F(PeriodLedgerTest, CalculatePeriod_Recalculate_RefreshesTotals)
{
    auto first = calculated(monthly(3), "1000.00", "400.00");

    EXPECT_CALL(*aggregator_, getTotals("client-1", _))
        .WillOnce(Return(makeTotals("1500.00", "400.00")));
    auto second = ledger_->calculatePeriod(monthly(3), true);

    EXPECT_FALSE(second.created);
    EXPECT_EQ(second.period.id, first.id);
    EXPECT_EQ(second.period.finalResult.toString(), "1100.00");
    EXPECT_EQ(repository_->count(), 1u);
}

TEST_F(PeriodLedgerTest, Calculate_Twice_SameTotals_IdenticalDerivedFields)
{
    auto first = calculated(monthly(5), "200.00", "500.00");
    auto second = calculated(monthly(5), "200.00", "500.00");

    EXPECT_EQ(first.vatDifference, second.vatDifference);
    EXPECT_EQ(first.finalResult, second.finalResult);
    EXPECT_EQ(first.isPayable, second.isPayable);
    EXPECT_EQ(first.isCredit, second.isCredit);
    EXPECT_EQ(first.creditToNext, second.creditToNext);
}

TEST_F(PeriodLedgerTest, Recalculate_WithoutFetch_KeepsTotals)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");

    EXPECT_CALL(*aggregator_, getTotals(_, _)).Times(0);
    auto updated = ledger_->recalculate(period.id, false);

    EXPECT_EQ(updated.vatOutput.toString(), "1000.00");
    EXPECT_EQ(updated.finalResult.toString(), "600.00");
}

TEST_F(PeriodLedgerTest, Recalculate_UnknownId_ThrowsNotFound)
{
    EXPECT_THROW(ledger_->recalculate(999, true), domain::NotFoundError);
}

// ============================================================================
// ТЕСТЫ: сбои агрегатора
// ============================================================================

TEST_F(PeriodLedgerTest, AggregatorUnavailable_NewPeriod_NothingInserted)
{
    EXPECT_CALL(*aggregator_, getTotals(_, _))
        .WillOnce(Throw(domain::AggregatorUnavailableError("timeout")));

    EXPECT_THROW(ledger_->calculatePeriod(monthly(3), false), domain::AggregatorUnavailableError);

    EXPECT_EQ(repository_->count(), 0u);
    EXPECT_FALSE(repository_->findByKey(monthly(3)).has_value());
}

TEST_F(PeriodLedgerTest, AggregatorUnavailable_ExistingPeriod_Unchanged)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");

    EXPECT_CALL(*aggregator_, getTotals(_, _))
        .WillOnce(Throw(domain::AggregatorUnavailableError("connection refused")));

    EXPECT_THROW(ledger_->recalculate(period.id, true), domain::AggregatorUnavailableError);

    auto stored = repository_->findById(period.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->vatOutput.toString(), "1000.00");
    EXPECT_EQ(stored->finalResult.toString(), "600.00");
}

TEST_F(PeriodLedgerTest, NegativeTotals_ThrowsInvalidTotals_NothingInserted)
{
    domain::VatTotals totals;
    totals.outputVat = Money::fromString("-1.00");
    totals.inputVat = Money::fromString("0.00");

    EXPECT_CALL(*aggregator_, getTotals(_, _)).WillOnce(Return(totals));

    EXPECT_THROW(ledger_->calculatePeriod(monthly(3), false), domain::InvalidTotalsError);
    EXPECT_EQ(repository_->count(), 0u);
}

// ============================================================================
// ТЕСТЫ: перенос кредита
// ============================================================================

TEST_F(PeriodLedgerTest, CarryForward_FromLockedPreviousPeriod)
{
    auto january = calculated(monthly(1), "200.00", "320.00");
    ASSERT_EQ(january.creditToNext.toString(), "120.00");
    ledger_->lock(january.id);

    EXPECT_CALL(*aggregator_, getTotals(_, _)).Times(0);
    auto february = ledger_->getOrCreate(monthly(2));

    EXPECT_TRUE(february.created);
    EXPECT_EQ(february.period.previousCredit.toString(), "120.00");
    EXPECT_EQ(february.period.vatOutput.toString(), "0.00");
    EXPECT_EQ(february.period.finalResult.toString(), "-120.00");
    EXPECT_EQ(february.period.creditSource, domain::CreditSource::AUTO);
}

TEST_F(PeriodLedgerTest, CarryForward_NoLockedPredecessor_IsZero)
{
    calculated(monthly(1), "200.00", "320.00");

    EXPECT_EQ(ledger_->carryForward(monthly(2)).toString(), "0.00");
}

TEST_F(PeriodLedgerTest, CarryForward_OtherClientIgnored)
{
    auto other = calculated(monthly(1, 2025, "client-2"), "0.00", "500.00");
    ledger_->lock(other.id);

    EXPECT_EQ(ledger_->carryForward(monthly(2)).toString(), "0.00");
    EXPECT_EQ(ledger_->carryForward(monthly(2, 2025, "client-2")).toString(), "500.00");
}

TEST_F(PeriodLedgerTest, CarryForward_ChainsThroughLockedPeriods)
{
    auto january = calculated(monthly(1), "200.00", "300.00");
    ledger_->lock(january.id);

    auto february = calculated(monthly(2), "0.00", "50.00");
    EXPECT_EQ(february.previousCredit.toString(), "100.00");
    EXPECT_EQ(february.creditToNext.toString(), "150.00");
    ledger_->lock(february.id);

    EXPECT_EQ(ledger_->carryForward(monthly(3)).toString(), "150.00");
}

TEST_F(PeriodLedgerTest, CarryForward_UsesLatestLockedPredecessorNotAdjacent)
{
    auto january = calculated(monthly(1), "0.00", "80.00");
    ledger_->lock(january.id);

    // Февраль не заблокирован: для апреля берётся январь
    calculated(monthly(2), "0.00", "999.00");

    EXPECT_EQ(ledger_->carryForward(monthly(4)).toString(), "80.00");
}

TEST_F(PeriodLedgerTest, CarryForward_SameEndDate_PrefersSamePeriodType)
{
    auto march = calculated(monthly(3), "0.00", "10.00");
    ledger_->lock(march.id);

    auto q1 = calculated(quarterly(1), "0.00", "30.00");
    EXPECT_EQ(q1.previousCredit.toString(), "0.00");
    ledger_->lock(q1.id);

    EXPECT_EQ(ledger_->carryForward(monthly(4)).toString(), "10.00");
    EXPECT_EQ(ledger_->carryForward(quarterly(2)).toString(), "30.00");
}

TEST_F(PeriodLedgerTest, CarryForward_AcrossYearBoundary)
{
    auto december = calculated(monthly(12, 2024), "100.00", "175.50");
    ledger_->lock(december.id);

    EXPECT_EQ(ledger_->carryForward(monthly(1, 2025)).toString(), "75.50");
}

TEST_F(PeriodLedgerTest, CarryForward_MonthlyToQuarterly)
{
    auto december = calculated(monthly(12, 2024), "100.00", "340.00");
    ledger_->lock(december.id);

    auto q1 = calculated(quarterly(1, 2025), "1000.00", "900.00");

    EXPECT_EQ(q1.previousCredit.toString(), "240.00");
    EXPECT_EQ(q1.creditSource, domain::CreditSource::AUTO);
    EXPECT_EQ(q1.finalResult.toString(), "-140.00");
    EXPECT_EQ(q1.creditToNext.toString(), "140.00");
}

TEST_F(PeriodLedgerTest, CarryForward_QuarterlyToMonthly)
{
    auto q4 = calculated(quarterly(4, 2024), "0.00", "60.00");
    ledger_->lock(q4.id);

    auto january = calculated(monthly(1, 2025), "100.00", "0.00");

    EXPECT_EQ(january.previousCredit.toString(), "60.00");
    EXPECT_EQ(january.finalResult.toString(), "40.00");
    EXPECT_TRUE(january.isPayable);
}

TEST_F(PeriodLedgerTest, CarryForward_TypeChange_LaterMonthBeatsEarlierQuarter)
{
    auto q4 = calculated(quarterly(4, 2024), "0.00", "60.00");
    ledger_->lock(q4.id);
    auto january = calculated(monthly(1, 2025), "0.00", "10.00");
    ASSERT_EQ(january.creditToNext.toString(), "70.00");
    ledger_->lock(january.id);

    // Январь закончился позже Q4, его кредит и переносится во Q2
    EXPECT_EQ(ledger_->carryForward(quarterly(2, 2025)).toString(), "70.00");
    // Q1 начинается 1 января: январь не предшественник, берётся Q4
    EXPECT_EQ(ledger_->carryForward(quarterly(1, 2025)).toString(), "60.00");
}

// ============================================================================
// ТЕСТЫ: lock / unlock
// ============================================================================

TEST_F(PeriodLedgerTest, Lock_SetsLockedAt)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");

    auto locked = ledger_->lock(period.id);

    EXPECT_TRUE(locked.isLocked);
    EXPECT_TRUE(locked.lockedAt.has_value());
    EXPECT_TRUE(repository_->findById(period.id)->isLocked);
}

TEST_F(PeriodLedgerTest, Lock_Twice_ThrowsAlreadyLocked)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");
    ledger_->lock(period.id);

    EXPECT_THROW(ledger_->lock(period.id), domain::AlreadyLockedError);
}

TEST_F(PeriodLedgerTest, Lock_UnknownId_ThrowsNotFound)
{
    EXPECT_THROW(ledger_->lock(42), domain::NotFoundError);
    EXPECT_THROW(ledger_->unlock(42), domain::NotFoundError);
}

TEST_F(PeriodLedgerTest, Locked_CalculateFails_AndFieldsUnchanged)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");
    ledger_->lock(period.id);

    EXPECT_CALL(*aggregator_, getTotals(_, _)).Times(0);
    EXPECT_THROW(ledger_->calculatePeriod(monthly(3), true), domain::LockedPeriodError);
    EXPECT_THROW(ledger_->recalculate(period.id, true), domain::LockedPeriodError);
    EXPECT_THROW(ledger_->calculate(monthly(3), false), domain::LockedPeriodError);

    auto stored = repository_->findById(period.id);
    EXPECT_EQ(stored->vatOutput.toString(), "1000.00");
    EXPECT_EQ(stored->vatInput.toString(), "400.00");
    EXPECT_EQ(stored->finalResult.toString(), "600.00");
    EXPECT_TRUE(stored->isLocked);
}

TEST_F(PeriodLedgerTest, Locked_WithoutRecalculate_ReturnsStoredRecord)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");
    ledger_->lock(period.id);

    auto result = ledger_->calculatePeriod(monthly(3), false);

    EXPECT_FALSE(result.created);
    EXPECT_TRUE(result.period.isLocked);
}

TEST_F(PeriodLedgerTest, Locked_SetCreditFails)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");
    ledger_->lock(period.id);

    EXPECT_THROW(ledger_->setCredit(period.id, Money::fromString("10.00"), false), domain::LockedPeriodError);
    EXPECT_THROW(ledger_->setCredit(period.id, Money::fromString("10.00"), true), domain::LockedPeriodError);
    EXPECT_THROW(ledger_->resetCredit(period.id), domain::LockedPeriodError);

    EXPECT_EQ(repository_->findById(period.id)->previousCredit.toString(), "0.00");
}

TEST_F(PeriodLedgerTest, Unlock_ThenCalculate_Succeeds)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");
    ledger_->lock(period.id);

    auto unlocked = ledger_->unlock(period.id);
    EXPECT_FALSE(unlocked.isLocked);
    EXPECT_FALSE(unlocked.lockedAt.has_value());

    auto recalculated = calculated(monthly(3), "1000.00", "500.00");
    EXPECT_EQ(recalculated.finalResult.toString(), "500.00");
}

TEST_F(PeriodLedgerTest, Unlock_NotLocked_IsNoop)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");

    auto result = ledger_->unlock(period.id);

    EXPECT_FALSE(result.isLocked);
    EXPECT_EQ(result.finalResult.toString(), "600.00");
}

TEST_F(PeriodLedgerTest, Unlock_RefusedWhileLaterPeriodLocked)
{
    auto january = calculated(monthly(1), "0.00", "100.00");
    ledger_->lock(january.id);
    auto february = calculated(monthly(2), "0.00", "0.00");
    ledger_->lock(february.id);

    EXPECT_THROW(ledger_->unlock(january.id), domain::LaterPeriodLockedError);
    EXPECT_TRUE(repository_->findById(january.id)->isLocked);

    // Сначала поздний, потом ранний: разрешено
    ledger_->unlock(february.id);
    EXPECT_NO_THROW(ledger_->unlock(january.id));
}

TEST_F(PeriodLedgerTest, Unlock_AllowedWhenLaterPeriodUnlocked)
{
    auto january = calculated(monthly(1), "0.00", "100.00");
    ledger_->lock(january.id);
    calculated(monthly(2), "0.00", "0.00");

    EXPECT_NO_THROW(ledger_->unlock(january.id));
}

// ============================================================================
// ТЕСТЫ: setCredit / resetCredit
// ============================================================================

TEST_F(PeriodLedgerTest, SetCredit_Reconciles)
{
    auto period = calculated(monthly(3), "200.00", "500.00");

    auto updated = ledger_->setCredit(period.id, Money::fromString("50.00"), false);

    EXPECT_EQ(updated.previousCredit.toString(), "50.00");
    EXPECT_EQ(updated.creditSource, domain::CreditSource::MANUAL);
    EXPECT_EQ(updated.vatDifference.toString(), "-300.00");
    EXPECT_EQ(updated.finalResult.toString(), "-350.00");
    EXPECT_TRUE(updated.isCredit);
    EXPECT_EQ(updated.creditToNext.toString(), "350.00");
}

TEST_F(PeriodLedgerTest, SetCredit_Negative_ThrowsValidation_NoChange)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");

    EXPECT_THROW(ledger_->setCredit(period.id, Money::fromString("-10.00"), false), domain::InvalidCreditError);
    EXPECT_THROW(ledger_->setCredit(period.id, Money::fromString("-10.00"), true), domain::ValidationError);

    auto stored = repository_->findById(period.id);
    EXPECT_EQ(stored->previousCredit.toString(), "0.00");
    EXPECT_EQ(stored->creditSource, domain::CreditSource::AUTO);
}

TEST_F(PeriodLedgerTest, SetCredit_NegativeOnUnknownId_ValidationFirst)
{
    EXPECT_THROW(ledger_->setCredit(777, Money::fromString("-1.00"), false), domain::InvalidCreditError);
    EXPECT_THROW(ledger_->setCredit(777, Money::fromString("1.00"), false), domain::NotFoundError);
}

TEST_F(PeriodLedgerTest, SetCredit_WithLockedPredecessor_RequiresForce)
{
    auto january = calculated(monthly(1), "0.00", "120.00");
    ledger_->lock(january.id);
    auto february = calculated(monthly(2), "500.00", "0.00");
    ASSERT_EQ(february.previousCredit.toString(), "120.00");

    EXPECT_THROW(ledger_->setCredit(february.id, Money::fromString("10.00"), false),
                 domain::CreditOverrideNotAllowedError);
    EXPECT_EQ(repository_->findById(february.id)->previousCredit.toString(), "120.00");

    auto forced = ledger_->setCredit(february.id, Money::fromString("10.00"), true);
    EXPECT_EQ(forced.previousCredit.toString(), "10.00");
    EXPECT_EQ(forced.finalResult.toString(), "490.00");
}

TEST_F(PeriodLedgerTest, ManualCredit_SurvivesRecalculation)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");
    ledger_->setCredit(period.id, Money::fromString("100.00"), false);

    auto recalculated = calculated(monthly(3), "1000.00", "400.00");

    EXPECT_EQ(recalculated.previousCredit.toString(), "100.00");
    EXPECT_EQ(recalculated.creditSource, domain::CreditSource::MANUAL);
    EXPECT_EQ(recalculated.finalResult.toString(), "500.00");
}

TEST_F(PeriodLedgerTest, ResetCredit_RestoresCarryForward)
{
    auto january = calculated(monthly(1), "0.00", "75.00");
    ledger_->lock(january.id);
    auto february = calculated(monthly(2), "300.00", "0.00");
    ledger_->setCredit(february.id, Money::fromString("5.00"), true);

    auto reset = ledger_->resetCredit(february.id);

    EXPECT_EQ(reset.creditSource, domain::CreditSource::AUTO);
    EXPECT_EQ(reset.previousCredit.toString(), "75.00");
    EXPECT_EQ(reset.finalResult.toString(), "225.00");
}

// ============================================================================
// ТЕСТЫ: границы хранимых сумм
// ============================================================================

TEST_F(PeriodLedgerTest, CarriedCreditBeyondStorage_Rejected_NothingInserted)
{
    auto january = calculated(monthly(1), "0.00", "9999999999999.99");
    ASSERT_EQ(january.creditToNext.toString(), "9999999999999.99");
    ledger_->lock(january.id);

    EXPECT_CALL(*aggregator_, getTotals(_, _))
        .WillOnce(Return(makeTotals("0.00", "9999999999999.99")));

    EXPECT_THROW(ledger_->calculatePeriod(monthly(2), false), domain::AmountOutOfRangeError);
    EXPECT_FALSE(repository_->findByKey(monthly(2)).has_value());
    EXPECT_EQ(repository_->count(), 1u);
}

TEST_F(PeriodLedgerTest, SetCredit_ResultBeyondStorage_RejectedAsValidation_NoChange)
{
    auto period = calculated(monthly(3), "0.00", "9999999999999.99");

    EXPECT_THROW(ledger_->setCredit(period.id, Money::fromString("1.00"), false), domain::ValidationError);

    auto stored = repository_->findById(period.id);
    EXPECT_EQ(stored->previousCredit.toString(), "0.00");
    EXPECT_EQ(stored->finalResult.toString(), "-9999999999999.99");
}

TEST_F(PeriodLedgerTest, LargestStorableAmounts_Accepted)
{
    auto period = calculated(monthly(3), "9999999999999.99", "0.00");

    EXPECT_EQ(period.finalResult.toString(), "9999999999999.99");
    EXPECT_TRUE(period.isPayable);
}

// ============================================================================
// ТЕСТЫ: getOrCreate / get / list
// ============================================================================

TEST_F(PeriodLedgerTest, GetOrCreate_Existing_ReturnsWithoutCreating)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");

    auto result = ledger_->getOrCreate(monthly(3));

    EXPECT_FALSE(result.created);
    EXPECT_EQ(result.period.id, period.id);
    EXPECT_EQ(repository_->count(), 1u);
}

TEST_F(PeriodLedgerTest, GetPeriod_ReturnsStoredOrNothing)
{
    auto period = calculated(monthly(3), "1000.00", "400.00");

    ASSERT_TRUE(ledger_->getPeriod(period.id).has_value());
    EXPECT_EQ(ledger_->getPeriod(period.id)->key, monthly(3));
    EXPECT_FALSE(ledger_->getPeriod(period.id + 100).has_value());
}

TEST_F(PeriodLedgerTest, ListPeriods_FilteredAndOrderedNewestFirst)
{
    ledger_->getOrCreate(monthly(1, 2024));
    ledger_->getOrCreate(monthly(11, 2024));
    ledger_->getOrCreate(monthly(2, 2025));
    ledger_->getOrCreate(quarterly(1, 2025));
    ledger_->getOrCreate(monthly(5, 2025, "client-2"));

    domain::PeriodFilter filter;
    filter.clientId = "client-1";
    auto all = ledger_->listPeriods(filter);

    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].key.year(), 2025);
    EXPECT_EQ(all[0].key.period(), 2);
    EXPECT_EQ(all[1].key.period(), 1);
    EXPECT_EQ(all[2].key, monthly(11, 2024));
    EXPECT_EQ(all[3].key, monthly(1, 2024));

    filter.periodType = PeriodType::QUARTERLY;
    auto quarterlyOnly = ledger_->listPeriods(filter);
    ASSERT_EQ(quarterlyOnly.size(), 1u);
    EXPECT_EQ(quarterlyOnly[0].key, quarterly(1, 2025));

    domain::PeriodFilter byYear;
    byYear.year = 2024;
    EXPECT_EQ(ledger_->listPeriods(byYear).size(), 2u);
}
