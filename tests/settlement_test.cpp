// pledge-Prod headers
#include "core/ContributionLedger.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/SettlementEngine.hpp"

// pledge-Fake headers
#include "FakeTransfer.hpp"
#include "Mocks.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <string>
#include <vector>

namespace pledge::test {

  using pledge::core::ContributionLedger;
  using pledge::core::ErrorMonitor;
  using pledge::core::SettlementEngine;
  using pledge::core::TransferError;
  using testing::HasSubstr;

  class SettlementEngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      engine = std::make_unique<SettlementEngine>(
          7, std::static_pointer_cast<ErrorMonitor>(errorMonitor));
    }

    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::unique_ptr<SettlementEngine> engine;
    ContributionLedger ledger;
    FakeTransfer transfer;
  };

  TEST_F(SettlementEngineTest, ctor_RejectsMissingErrorMonitor) {
    EXPECT_THROW(SettlementEngine(7, nullptr), std::invalid_argument);
  }

  TEST_F(SettlementEngineTest, distributeAll_IsolatesSingleFailedRecipient) {
    ledger.record("alice", 3);
    ledger.record("bob", 5);
    ledger.record("carol", 0);
    transfer.failing.insert("bob");

    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("bob"))).Times(1);

    auto report = engine->distributeAll(ledger, transfer);

    EXPECT_EQ(ledger.balanceOf("alice"), 0u);
    EXPECT_EQ(ledger.balanceOf("bob"), 0u);
    EXPECT_EQ(ledger.balanceOf("carol"), 0u);

    ASSERT_EQ(report.delivered.size(), 1u);
    EXPECT_EQ(report.delivered[0].to, "alice");
    EXPECT_EQ(report.delivered[0].amount, 3u);

    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].to, "bob");
    EXPECT_EQ(report.failed[0].amount, 5u);
    EXPECT_EQ(report.failed[0].reason, "recipient rejected");
    EXPECT_FALSE(report.clean());

    // zero balance: no transfer attempted at all
    EXPECT_EQ(transfer.calls.size(), 2u);
    EXPECT_EQ(transfer.paidTo("alice"), 3u);
  }

  TEST_F(SettlementEngineTest, distributeAll_FailureDoesNotBlockLaterRecipients) {
    ledger.record("bob", 5);
    ledger.record("alice", 3);
    transfer.throwing.insert("bob");

    auto report = engine->distributeAll(ledger, transfer);

    EXPECT_EQ(transfer.paidTo("alice"), 3u);
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].reason, "backend unavailable");
    EXPECT_EQ(report.deliveredTotal(), 3u);
    EXPECT_EQ(report.failedTotal(), 5u);
  }

  TEST_F(SettlementEngineTest, distributeAll_SettlesBeforeTransferring) {
    ledger.record("alice", 3);
    ledger.record("bob", 5);

    std::vector<core::Amount> seenBalance;
    transfer.onTransfer = [&](const core::Identity& to, core::Amount) {
      seenBalance.push_back(ledger.balanceOf(to));
      // a re-entrant settlement of the same contributor finds nothing
      EXPECT_EQ(ledger.settle(to), 0u);
    };

    auto report = engine->distributeAll(ledger, transfer);

    EXPECT_EQ(seenBalance, (std::vector<core::Amount>{ 0, 0 }));
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.deliveredTotal(), 8u);
  }

  TEST_F(SettlementEngineTest, distributeAll_SecondRunPaysNothing) {
    ledger.record("alice", 3);
    engine->distributeAll(ledger, transfer);

    auto again = engine->distributeAll(ledger, transfer);

    EXPECT_TRUE(again.delivered.empty());
    EXPECT_TRUE(again.failed.empty());
    EXPECT_EQ(transfer.paidTo("alice"), 3u);
  }

  TEST_F(SettlementEngineTest, refundOne_IsIdempotent) {
    ledger.record("alice", 7);

    EXPECT_EQ(engine->refundOne(ledger, "alice", transfer), 7u);
    EXPECT_EQ(engine->refundOne(ledger, "alice", transfer), 0u);
    EXPECT_EQ(engine->refundOne(ledger, "stranger", transfer), 0u);

    EXPECT_EQ(transfer.calls.size(), 1u);
    EXPECT_EQ(transfer.paidTo("alice"), 7u);
  }

  TEST_F(SettlementEngineTest, distributeAll_NonStandardThrowCountsAsFailure) {
    ledger.record("alice", 3);
    ledger.record("bob", 5);
    ledger.record("carol", 2);
    transfer.foreign.insert("bob");

    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("campaign 7: refund of 5 to bob"))).Times(1);

    auto report = engine->distributeAll(ledger, transfer);

    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].to, "bob");
    EXPECT_THAT(report.failed[0].reason, HasSubstr("non-standard exception"));
    EXPECT_EQ(report.deliveredTotal(), 5u);
    EXPECT_EQ(transfer.paidTo("carol"), 2u);
    EXPECT_EQ(ledger.totalOutstanding(), 0u);
  }

  TEST_F(SettlementEngineTest, failures_AreDistinctPerCampaignInSharedMonitor) {
    auto shared = std::make_shared<ErrorMonitor>();
    std::vector<std::string> escalated;
    shared->registerEscalation([&](const std::string& msg) { escalated.push_back(msg); });

    SettlementEngine first(1, shared);
    SettlementEngine second(2, shared);
    transfer.failing.insert("olivia");

    EXPECT_THROW(first.withdrawToOwner("olivia", 11, transfer), TransferError);
    EXPECT_THROW(second.withdrawToOwner("olivia", 11, transfer), TransferError);
    EXPECT_THROW(second.withdrawToOwner("olivia", 11, transfer), TransferError);

    ASSERT_EQ(escalated.size(), 2u);
    EXPECT_THAT(escalated[0], HasSubstr("campaign 1:"));
    EXPECT_THAT(escalated[1], HasSubstr("campaign 2:"));
  }

  TEST_F(SettlementEngineTest, refundOne_FailureRestoresBalanceAndThrows) {
    ledger.record("bob", 5);
    transfer.failing.insert("bob");

    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("refund of 5 to bob"))).Times(1);
    EXPECT_THROW(engine->refundOne(ledger, "bob", transfer), TransferError);
    EXPECT_EQ(ledger.balanceOf("bob"), 5u);

    transfer.failing.clear();
    EXPECT_EQ(engine->refundOne(ledger, "bob", transfer), 5u);
    EXPECT_EQ(ledger.balanceOf("bob"), 0u);
  }

  TEST_F(SettlementEngineTest, withdrawToOwner_SurfacesFailure) {
    transfer.failing.insert("olivia");

    EXPECT_CALL(*errorMonitor, notifyFailure(HasSubstr("withdraw"))).Times(1);
    EXPECT_THROW(engine->withdrawToOwner("olivia", 11, transfer), TransferError);

    transfer.failing.clear();
    EXPECT_EQ(engine->withdrawToOwner("olivia", 11, transfer), 11u);
    EXPECT_EQ(transfer.paidTo("olivia"), 11u);
  }

  TEST_F(SettlementEngineTest, retry_OnlyReattemptsFailedEntries) {
    ledger.record("alice", 3);
    ledger.record("bob", 5);
    transfer.failing.insert("bob");
    auto first = engine->distributeAll(ledger, transfer);

    transfer.failing.clear();
    auto second = engine->retry(first.failed, transfer);

    EXPECT_TRUE(second.clean());
    ASSERT_EQ(second.delivered.size(), 1u);
    EXPECT_EQ(second.delivered[0].to, "bob");
    EXPECT_EQ(transfer.paidTo("alice"), 3u);
    EXPECT_EQ(transfer.paidTo("bob"), 5u);
  }

  TEST_F(SettlementEngineTest, summary_NamesFailedRecipients) {
    core::SettlementReport report;
    report.delivered.push_back({ "alice", 3 });
    report.failed.push_back({ "bob", 5, "recipient rejected" });

    EXPECT_EQ(report.summary(), "delivered=1/3 failed=1/5 [bob:5 recipient rejected]");
  }

} // namespace pledge::test
