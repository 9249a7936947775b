/**
 * @file BalanceCalculatorTest.cpp
 * @brief Unit-тесты тождества сверки
 */

#include <gtest/gtest.h>
#include "application/BalanceCalculator.hpp"
#include "mocks/TestData.hpp"

using namespace reconciliation;
using namespace reconciliation::application;
using namespace reconciliation::tests::mocks;

// ============================================================================
// Классификация несверенных строк
// ============================================================================

TEST(BalanceCalculatorTest, EmptyPools_DifferenceIsStatementMinusBook) {
    domain::TransactionPartition pools;

    auto s = BalanceCalculator::calculate(money("1000.00"), money("1000.00"), pools);

    EXPECT_TRUE(s.interestNotInBook.isZero());
    EXPECT_TRUE(s.chargesNotInBook.isZero());
    EXPECT_TRUE(s.depositsInTransit.isZero());
    EXPECT_TRUE(s.outstandingWithdrawals.isZero());
    EXPECT_EQ(s.adjustedBookBalance, money("1000.00"));
    EXPECT_EQ(s.adjustedBankBalance, money("1000.00"));
    EXPECT_TRUE(s.difference.isZero());
    EXPECT_TRUE(s.canFinalize());
}

TEST(BalanceCalculatorTest, StatementItems_SplitIntoInterestAndCharges) {
    domain::TransactionPartition pools;
    pools.statementItems.push_back(statementItem(1, 10, "2024-03-10", "12.50", "Interest"));
    pools.statementItems.push_back(statementItem(2, 10, "2024-03-15", "-150.00", "Service fee"));
    pools.statementItems.push_back(statementItem(3, 10, "2024-03-20", "-4.25", "Wire fee"));

    auto s = BalanceCalculator::calculate(money("5000.00"), money("4858.25"), pools);

    EXPECT_EQ(s.interestNotInBook, money("12.50"));
    EXPECT_EQ(s.chargesNotInBook, money("154.25"));
    EXPECT_EQ(s.adjustedBookBalance, money("4858.25"));
    EXPECT_EQ(s.adjustedBankBalance, money("4858.25"));
    EXPECT_TRUE(s.difference.isZero());
}

TEST(BalanceCalculatorTest, SystemItems_SplitIntoDepositsAndWithdrawals) {
    domain::TransactionPartition pools;
    pools.systemItems.push_back(systemItem(1, 10, "2024-03-30", "700.00"));
    pools.systemItems.push_back(systemItem(2, 10, "2024-03-31", "-200.00"));

    auto s = BalanceCalculator::calculate(money("1500.00"), money("1000.00"), pools);

    EXPECT_EQ(s.depositsInTransit, money("700.00"));
    EXPECT_EQ(s.outstandingWithdrawals, money("200.00"));
    EXPECT_EQ(s.adjustedBankBalance, money("1500.00"));
    EXPECT_EQ(s.adjustedBookBalance, money("1500.00"));
    EXPECT_TRUE(s.difference.isZero());
}

TEST(BalanceCalculatorTest, ReconciledRowsAreIgnored) {
    domain::TransactionPartition pools;
    auto matched = statementItem(1, 10, "2024-03-10", "-50.00");
    matched.isReconciled = true;
    matched.reconciliationId = 7;
    pools.statementItems.push_back(matched);

    auto s = BalanceCalculator::calculate(money("100.00"), money("100.00"), pools);

    EXPECT_TRUE(s.chargesNotInBook.isZero());
    EXPECT_TRUE(s.difference.isZero());
}

// ============================================================================
// Сценарий: комиссия банка без отражения в учёте
// ============================================================================

TEST(BalanceCalculatorTest, UnbookedFee_DifferenceEqualsFee) {
    // Выписка уже учла комиссию, учёт ещё нет. Строка выписки попадает
    // в chargesNotInBook и корректирует книжный остаток.
    domain::TransactionPartition pools;
    pools.statementItems.push_back(statementItem(1, 10, "2024-03-31", "-150.00", "Monthly fee"));

    auto s = BalanceCalculator::calculate(money("2000.00"), money("2000.00"), pools);

    EXPECT_EQ(s.chargesNotInBook, money("150.00"));
    EXPECT_EQ(s.adjustedBookBalance, money("1850.00"));
    EXPECT_EQ(s.adjustedBankBalance, money("2000.00"));
    EXPECT_EQ(s.difference, money("150.00"));
    EXPECT_FALSE(s.canFinalize());
}

TEST(BalanceCalculatorTest, NegativeDifference_WhenBookExceedsBank) {
    domain::TransactionPartition pools;

    auto s = BalanceCalculator::calculate(money("1000.02"), money("1000.00"), pools);

    EXPECT_EQ(s.difference, money("-0.02"));
    EXPECT_EQ(s.difference.toString(), "-0.02");
    EXPECT_FALSE(s.canFinalize());
}

TEST(BalanceCalculatorTest, CanFinalize_IsStrictlyBelowTolerance) {
    domain::TransactionPartition pools;

    auto below = BalanceCalculator::calculate(money("1000.00"), money("1000.009"), pools);
    EXPECT_TRUE(below.canFinalize());

    auto atTolerance = BalanceCalculator::calculate(money("1000.00"), money("1000.01"), pools);
    EXPECT_FALSE(atTolerance.canFinalize());
}

TEST(BalanceCalculatorTest, ZeroAmountRows_ContributeNothing) {
    domain::TransactionPartition pools;
    pools.statementItems.push_back(statementItem(1, 10, "2024-03-10", "0.00"));
    pools.systemItems.push_back(systemItem(2, 10, "2024-03-10", "0"));

    auto s = BalanceCalculator::calculate(money("10.00"), money("10.00"), pools);

    EXPECT_TRUE(s.interestNotInBook.isZero());
    EXPECT_TRUE(s.chargesNotInBook.isZero());
    EXPECT_TRUE(s.depositsInTransit.isZero());
    EXPECT_TRUE(s.outstandingWithdrawals.isZero());
}
