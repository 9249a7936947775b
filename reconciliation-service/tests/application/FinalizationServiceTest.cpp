/**
 * @file FinalizationServiceTest.cpp
 * @brief Unit-тесты финализации сверки
 */

#include <gtest/gtest.h>
#include "application/FinalizationService.hpp"
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

class FinalizationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repo_ = std::make_shared<InMemoryReconciliationRepository>();
        pool_ = std::make_shared<InMemoryTransactionPool>(repo_);
        oracle_ = std::make_shared<InMemoryBalanceOracle>();
        accounts_ = std::make_shared<InMemoryBankAccountDirectory>();
        accounts_->add(bankAccount(10, 1010));

        auto summaries = std::make_shared<BalanceSummaryService>(repo_, pool_, oracle_, accounts_);
        service_ = std::make_shared<FinalizationService>(repo_, summaries);
        matching_ = std::make_shared<MatchingService>(repo_, pool_, accounts_);

        oracle_->setOpening(1010, money("2000.00"));
        draftId_ = repo_->getOrCreateDraft(10, date("2024-03-31"), money("2000.00"), std::nullopt, 42).id;
    }

    ports::input::FinalizeRequest finalizeRequest(const std::string& statementBalance,
                                                  const std::string& bookBalance,
                                                  const std::string& difference) {
        ports::input::FinalizeRequest r;
        r.reconciliationId = draftId_;
        r.statementEndingBalance = money(statementBalance);
        r.bookBalance = money(bookBalance);
        r.difference = money(difference);
        r.actorId = 42;
        return r;
    }

    std::shared_ptr<InMemoryReconciliationRepository> repo_;
    std::shared_ptr<InMemoryTransactionPool> pool_;
    std::shared_ptr<InMemoryBalanceOracle> oracle_;
    std::shared_ptr<InMemoryBankAccountDirectory> accounts_;
    std::shared_ptr<FinalizationService> service_;
    std::shared_ptr<MatchingService> matching_;
    int64_t draftId_ = 0;
};

// ============================================================================
// Успешная финализация
// ============================================================================

TEST_F(FinalizationServiceTest, Finalize_BalancedDraft) {
    auto result = service_->finalize(finalizeRequest("2000.00", "2000.00", "0.00"));

    ASSERT_TRUE(result.ok()) << result.error().message;
    const auto& rec = result.value();
    EXPECT_TRUE(rec.isFinalized());
    ASSERT_TRUE(rec.finalizedAt.has_value());
    ASSERT_TRUE(rec.calculatedBookBalance.has_value());
    EXPECT_EQ(*rec.calculatedBookBalance, money("2000.00"));
    ASSERT_TRUE(rec.difference.has_value());
    EXPECT_TRUE(rec.difference->isZero());
    EXPECT_EQ(repo_->finalizeCalls(), 1);
}

TEST_F(FinalizationServiceTest, Finalize_PersistsConfirmedStatementBalance) {
    // Черновик сохранён с 2000.00, пользователь подтверждает 1850.00 после
    // учёта комиссии 150.00, которой нет в книге
    pool_->add(statementItem(1, 10, "2024-03-31", "-150.00", "Monthly fee"));

    auto result = service_->finalize(finalizeRequest("1850.00", "1850.00", "0.00"));

    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result.value().statementEndingBalance, money("1850.00"));
}

TEST_F(FinalizationServiceTest, Finalize_DifferenceBelowTolerance) {
    auto result = service_->finalize(finalizeRequest("2000.009", "2000.00", "0.009"));

    EXPECT_TRUE(result.ok());
}

TEST_F(FinalizationServiceTest, Finalize_DoesNotTouchTransactions) {
    pool_->add(statementItem(1, 10, "2024-03-10", "50.00"));
    pool_->add(systemItem(2, 10, "2024-03-10", "50.00"));
    oracle_->post(1010, date("2024-03-10"), money("50.00"));
    ports::input::MatchRequest match;
    match.reconciliationId = draftId_;
    match.statementTransactionIds = {1};
    match.systemTransactionIds = {2};
    match.statementDate = date("2024-03-31");
    ASSERT_TRUE(matching_->match(match).ok());

    auto result = service_->finalize(finalizeRequest("2050.00", "2050.00", "0"));

    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(pool_->get(1).reconciliationId.value(), draftId_);
    EXPECT_EQ(pool_->get(2).reconciliationId.value(), draftId_);
}

// ============================================================================
// Отказы
// ============================================================================

TEST_F(FinalizationServiceTest, Finalize_DifferenceAboveTolerance_NotBalanced) {
    auto result = service_->finalize(finalizeRequest("2000.02", "2000.00", "0.02"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::NOT_BALANCED);
    EXPECT_EQ(result.error().tolerance->toString(), "0.01");

    auto rec = repo_->findById(draftId_);
    ASSERT_TRUE(rec.has_value());
    EXPECT_TRUE(rec->isDraft());
    EXPECT_EQ(repo_->finalizeCalls(), 0);
}

TEST_F(FinalizationServiceTest, Finalize_DifferenceExactlyTolerance_NotBalanced) {
    auto result = service_->finalize(finalizeRequest("2000.01", "2000.00", "-0.01"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::NOT_BALANCED);
}

TEST_F(FinalizationServiceTest, Finalize_StaleDifference_Recomputed) {
    // Клиент показывает нулевую разницу, но в пуле есть неучтённая комиссия
    pool_->add(statementItem(1, 10, "2024-03-31", "-150.00", "Monthly fee"));

    auto result = service_->finalize(finalizeRequest("2000.00", "2000.00", "0.00"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::NOT_BALANCED);
    EXPECT_NE(result.error().message.find("150.00"), std::string::npos);
    EXPECT_TRUE(repo_->findById(draftId_)->isDraft());
}

TEST_F(FinalizationServiceTest, Finalize_BookBalanceDisagreesWithRecomputed_NotBalanced) {
    // Разница, переданная клиентом, нулевая, но учётный остаток 1990.00
    // не совпадает с пересчитанным 2000.00
    auto result = service_->finalize(finalizeRequest("2000.00", "1990.00", "0.00"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::NOT_BALANCED);
    EXPECT_NE(result.error().message.find("1990.00"), std::string::npos);
    EXPECT_NE(result.error().message.find("2000.00"), std::string::npos);
    EXPECT_TRUE(repo_->findById(draftId_)->isDraft());
    EXPECT_EQ(repo_->finalizeCalls(), 0);
}

TEST_F(FinalizationServiceTest, Finalize_BookBalanceWithinCent_Accepted) {
    auto result = service_->finalize(finalizeRequest("2000.00", "2000.004", "0.00"));

    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(*result.value().calculatedBookBalance, money("2000.004"));
}

TEST_F(FinalizationServiceTest, Finalize_Twice_AlreadyFinalized) {
    auto first = service_->finalize(finalizeRequest("2000.00", "2000.00", "0.00"));
    ASSERT_TRUE(first.ok());
    auto finalizedAt = first.value().finalizedAt->toEpochSeconds();

    auto second = service_->finalize(finalizeRequest("2000.00", "2000.00", "0.00"));

    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error().kind, domain::ErrorKind::ALREADY_FINALIZED);
    EXPECT_EQ(second.error().recordId.value(), draftId_);
    EXPECT_EQ(repo_->findById(draftId_)->finalizedAt->toEpochSeconds(), finalizedAt);
    EXPECT_EQ(repo_->finalizeCalls(), 1);
}

TEST_F(FinalizationServiceTest, Finalize_AlreadyFinalizedCheckedBeforeDifference) {
    repo_->forceFinalize(draftId_);

    auto result = service_->finalize(finalizeRequest("2000.00", "2000.00", "5.00"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::ALREADY_FINALIZED);
}

TEST_F(FinalizationServiceTest, Finalize_Unknown_NotFound) {
    auto request = finalizeRequest("2000.00", "2000.00", "0.00");
    request.reconciliationId = 404;

    auto result = service_->finalize(request);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::NOT_FOUND);
}

TEST_F(FinalizationServiceTest, Finalize_StorageDown_Persistence) {
    repo_->setBroken(true);

    auto result = service_->finalize(finalizeRequest("2000.00", "2000.00", "0.00"));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::PERSISTENCE);
}

// ============================================================================
// После финализации
// ============================================================================

TEST_F(FinalizationServiceTest, Unmatch_AfterFinalize_Immutable) {
    pool_->add(statementItem(1, 10, "2024-03-10", "50.00"));
    pool_->add(systemItem(2, 10, "2024-03-10", "50.00"));
    oracle_->post(1010, date("2024-03-10"), money("50.00"));
    ports::input::MatchRequest match;
    match.reconciliationId = draftId_;
    match.statementTransactionIds = {1};
    match.systemTransactionIds = {2};
    match.statementDate = date("2024-03-31");
    ASSERT_TRUE(matching_->match(match).ok());
    ASSERT_TRUE(service_->finalize(finalizeRequest("2050.00", "2050.00", "0.00")).ok());

    auto result = matching_->unmatch({1, 2}, 42);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, domain::ErrorKind::IMMUTABLE_RECORD);
    EXPECT_TRUE(pool_->get(1).isReconciled);
    EXPECT_TRUE(pool_->get(2).isReconciled);
}
