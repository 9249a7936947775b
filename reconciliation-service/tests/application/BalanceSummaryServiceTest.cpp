/**
 * @file BalanceSummaryServiceTest.cpp
 * @brief Unit-тесты расчёта итогов сверки по данным хранилища
 */

#include <gtest/gtest.h>
#include "application/BalanceSummaryService.hpp"
#include "application/MatchingService.hpp"
#include "mocks/InMemoryReconciliationRepository.hpp"
#include "mocks/InMemoryTransactionPool.hpp"
#include "mocks/InMemoryBalanceOracle.hpp"
#include "mocks/InMemoryBankAccountDirectory.hpp"
#include "mocks/TestData.hpp"

using namespace reconciliation;
using namespace reconciliation::application;
using namespace reconciliation::tests::mocks;

class BalanceSummaryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<InMemoryReconciliationRepository>();
        pool_ = std::make_shared<InMemoryTransactionPool>(repo_);
        oracle_ = std::make_shared<InMemoryBalanceOracle>();
        accounts_ = std::make_shared<InMemoryBankAccountDirectory>();
        accounts_->add(bankAccount(10, 1010));

        service_ = std::make_shared<BalanceSummaryService>(repo_, pool_, oracle_, accounts_);
        matching_ = std::make_shared<MatchingService>(repo_, pool_, accounts_);

        oracle_->setOpening(1010, money("1000.00"));
        draftId_ = repo_->getOrCreateDraft(10, date("2024-03-31"), money("1500.00"), std::nullopt, 42).id;
    }

    std::shared_ptr<InMemoryReconciliationRepository> repo_;
    std::shared_ptr<InMemoryTransactionPool> pool_;
    std::shared_ptr<InMemoryBalanceOracle> oracle_;
    std::shared_ptr<InMemoryBankAccountDirectory> accounts_;
    std::shared_ptr<ports::input::IBalanceSummaryService> service_;
    std::shared_ptr<MatchingService> matching_;
    int64_t draftId_ = 0;
};

TEST_F(BalanceSummaryServiceTest, GlBalanceIsTakenAsOfStatementDate) {
    oracle_->post(1010, date("2024-03-20"), money("500.00"));
    oracle_->post(1010, date("2024-04-02"), money("999.00"));

    auto result = service_->calculateSummary(draftId_);

    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result.value().glBalance, money("1500.00"));
    EXPECT_EQ(result.value().glBalance.currency, "SGD");
    EXPECT_TRUE(result.value().difference.isZero());
    EXPECT_TRUE(result.value().canFinalize());
}

TEST_F(BalanceSummaryServiceTest, UsesStoredStatementBalanceByDefault) {
    auto result = service_->calculateSummary(draftId_);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().statementEndingBalance, money("1500.00"));
    EXPECT_EQ(result.value().difference, money("500.00"));
}

TEST_F(BalanceSummaryServiceTest, OverrideStatementBalance) {
    auto result = service_->calculateSummary(draftId_, money("1000.00"));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().statementEndingBalance, money("1000.00"));
    EXPECT_TRUE(result.value().difference.isZero());
}

TEST_F(BalanceSummaryServiceTest, UnbookedFee_ThenMatchedAfterBooking) {
    // Выписка: 1000.00 минус комиссия 150.00. В учёте комиссии ещё нет.
    repo_->getOrCreateDraft(10, date("2024-03-31"), money("850.00"), std::nullopt, 42);
    pool_->add(statementItem(1, 10, "2024-03-31", "-150.00", "Monthly fee"));

    auto before = service_->calculateSummary(draftId_);
    ASSERT_TRUE(before.ok());
    EXPECT_EQ(before.value().chargesNotInBook, money("150.00"));
    EXPECT_EQ(before.value().adjustedBookBalance, money("850.00"));
    EXPECT_TRUE(before.value().difference.isZero());

    // Комиссию провели в учёте: GL уменьшился, в пуле появилась системная операция
    oracle_->post(1010, date("2024-03-31"), money("-150.00"));
    pool_->add(systemItem(2, 10, "2024-03-31", "-150.00", "Bank Rec: Monthly fee"));

    auto booked = service_->calculateSummary(draftId_);
    ASSERT_TRUE(booked.ok());
    EXPECT_EQ(booked.value().chargesNotInBook, money("150.00"));
    EXPECT_EQ(booked.value().outstandingWithdrawals, money("150.00"));

    ports::input::MatchRequest request;
    request.reconciliationId = draftId_;
    request.statementTransactionIds = {1};
    request.systemTransactionIds = {2};
    request.statementDate = date("2024-03-31");
    ASSERT_TRUE(matching_->match(request).ok());

    auto matched = service_->calculateSummary(draftId_);
    ASSERT_TRUE(matched.ok());
    EXPECT_TRUE(matched.value().chargesNotInBook.isZero());
    EXPECT_TRUE(matched.value().outstandingWithdrawals.isZero());
    EXPECT_EQ(matched.value().glBalance, money("850.00"));
    EXPECT_TRUE(matched.value().difference.isZero());
}

TEST_F(BalanceSummaryServiceTest, DepositInTransit) {
    pool_->add(systemItem(1, 10, "2024-03-30", "500.00", "Customer receipt"));
    oracle_->post(1010, date("2024-03-30"), money("500.00"));
    repo_->getOrCreateDraft(10, date("2024-03-31"), money("1000.00"), std::nullopt, 42);

    auto result = service_->calculateSummary(draftId_);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().depositsInTransit, money("500.00"));
    EXPECT_EQ(result.value().adjustedBankBalance, money("1500.00"));
    EXPECT_EQ(result.value().adjustedBookBalance, money("1500.00"));
    EXPECT_TRUE(result.value().canFinalize());
}

TEST_F(BalanceSummaryServiceTest, UnknownReconciliation_NotFound) {
    auto result = service_->calculateSummary(404);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::NOT_FOUND);
}

TEST_F(BalanceSummaryServiceTest, AccountWithoutGlLink_Validation) {
    accounts_->add(bankAccount(11, 0));
    int64_t id = repo_->getOrCreateDraft(11, date("2024-03-31"), money("0"), std::nullopt, 42).id;

    auto result = service_->calculateSummary(id);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::VALIDATION);
    EXPECT_NE(result.error().message.find("GL account"), std::string::npos);
}

TEST_F(BalanceSummaryServiceTest, StorageDown_Persistence) {
    repo_->setBroken(true);

    auto result = service_->calculateSummary(draftId_);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::PERSISTENCE);
}
