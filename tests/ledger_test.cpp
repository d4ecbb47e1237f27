#include "core/ContributionLedger.hpp"
#include "core/Errors.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace pledge::core;

TEST(contribution_ledger, record_ReturnsOldAndNewTotals) {
  ContributionLedger ledger;

  auto first = ledger.record("alice", 4);
  EXPECT_EQ(first.oldTotal, 0u);
  EXPECT_EQ(first.newTotal, 4u);
  EXPECT_TRUE(first.firstContribution);

  auto second = ledger.record("alice", 3);
  EXPECT_EQ(second.oldTotal, 4u);
  EXPECT_EQ(second.newTotal, 7u);
  EXPECT_FALSE(second.firstContribution);
  EXPECT_EQ(ledger.balanceOf("alice"), 7u);
}

TEST(contribution_ledger, index_KeepsFirstContributionOrderWithoutDuplicates) {
  ContributionLedger ledger;
  ledger.record("bob", 1);
  ledger.record("alice", 1);
  ledger.record("bob", 2);
  ledger.record("carol", 5);

  const std::vector<Identity> expected{ "bob", "alice", "carol" };
  EXPECT_EQ(ledger.contributors(), expected);
}

TEST(contribution_ledger, settle_ZeroesOnceThenReturnsZero) {
  ContributionLedger ledger;
  ledger.record("alice", 9);

  EXPECT_EQ(ledger.settle("alice"), 9u);
  EXPECT_EQ(ledger.balanceOf("alice"), 0u);
  EXPECT_EQ(ledger.settle("alice"), 0u);
  EXPECT_EQ(ledger.settle("nobody"), 0u);

  // settled contributors stay in the index
  ASSERT_EQ(ledger.contributors().size(), 1u);
}

TEST(contribution_ledger, totalOutstanding_TracksSumOfBalances) {
  ContributionLedger ledger;
  Amount expected = 0;
  for (Amount a : { 3u, 8u, 1u, 13u, 2u }) {
    ledger.record(a % 2 ? "odd" : "even", a);
    expected += a;
    EXPECT_EQ(ledger.totalOutstanding(), expected);
  }

  expected -= ledger.settle("odd");
  EXPECT_EQ(ledger.totalOutstanding(), expected);
}

TEST(contribution_ledger, revert_UndoesFirstContributionAndIndexEntry) {
  ContributionLedger ledger;
  ledger.record("alice", 2);
  auto rec = ledger.record("bob", 5);

  ledger.revert("bob", rec);

  EXPECT_EQ(ledger.balanceOf("bob"), 0u);
  ASSERT_EQ(ledger.contributors().size(), 1u);
  EXPECT_EQ(ledger.contributors().front(), "alice");
}

TEST(contribution_ledger, revert_RestoresPreviousTotalForRepeatContributor) {
  ContributionLedger ledger;
  ledger.record("alice", 2);
  auto rec = ledger.record("alice", 5);

  ledger.revert("alice", rec);

  EXPECT_EQ(ledger.balanceOf("alice"), 2u);
  EXPECT_EQ(ledger.contributors().size(), 1u);
}

TEST(contribution_ledger, restore_PutsBackSettledBalance) {
  ContributionLedger ledger;
  ledger.record("alice", 6);
  const auto owed = ledger.settle("alice");

  ledger.restore("alice", owed);

  EXPECT_EQ(ledger.balanceOf("alice"), 6u);
  EXPECT_THROW(ledger.restore("stranger", 1), std::logic_error);
}

TEST(contribution_ledger, record_RejectsOverflowWithoutMutation) {
  ContributionLedger ledger;
  ledger.record("whale", std::numeric_limits<Amount>::max() - 1);

  EXPECT_THROW(ledger.record("whale", 2), ValidationError);
  EXPECT_EQ(ledger.balanceOf("whale"), std::numeric_limits<Amount>::max() - 1);
}
