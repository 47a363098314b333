// StakeLedger - Accrual Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>

#include <stakeledger/ledger/accrual.h>

namespace stakeledger {
namespace ledger {
namespace {

constexpr int64_t T0 = 1700000000;

// ============================================================================
// ComputeAccrual
// ============================================================================

TEST(AccrualTest, OneUnitPerStakedUnitPerDay) {
    Amount accrued;
    ASSERT_TRUE(ComputeAccrual(Tokens(100), SECONDS_PER_DAY, accrued));
    EXPECT_EQ(accrued, Tokens(100));
}

TEST(AccrualTest, ProportionalToElapsedTime) {
    Amount accrued;
    // 100 tokens for 864 seconds (1% of a day)
    ASSERT_TRUE(ComputeAccrual(Tokens(100), 864, accrued));
    EXPECT_EQ(accrued, Tokens(1));

    ASSERT_TRUE(ComputeAccrual(Tokens(10), 3 * SECONDS_PER_DAY, accrued));
    EXPECT_EQ(accrued, Tokens(30));
}

TEST(AccrualTest, TruncatesTowardZero) {
    Amount accrued;
    // 1 base unit for one second: 1 / 86400 floors to zero
    ASSERT_TRUE(ComputeAccrual(Amount(1), 1, accrued));
    EXPECT_TRUE(accrued.IsZero());

    // 1 token for one second: 1e18 / 86400 = 11574074074074.07...
    ASSERT_TRUE(ComputeAccrual(OneToken(), 1, accrued));
    EXPECT_EQ(accrued, Amount(11574074074074ULL));
}

TEST(AccrualTest, NonPositiveElapsedAccruesNothing) {
    Amount accrued(5);
    ASSERT_TRUE(ComputeAccrual(Tokens(100), 0, accrued));
    EXPECT_TRUE(accrued.IsZero());
    ASSERT_TRUE(ComputeAccrual(Tokens(100), -50, accrued));
    EXPECT_TRUE(accrued.IsZero());
}

TEST(AccrualTest, OverflowReported) {
    Amount accrued;
    EXPECT_FALSE(ComputeAccrual(Amount::Max(), 100 * SECONDS_PER_DAY, accrued));
}

// ============================================================================
// Checkpoint
// ============================================================================

TEST(AccrualTest, CheckpointFoldsRewards) {
    StakeAccount account;
    account.stakedAmount = Tokens(100);
    account.lastUpdateTime = T0;

    ASSERT_TRUE(Checkpoint(account, T0 + 864));
    EXPECT_EQ(account.unclaimedRewards, Tokens(1));
    EXPECT_EQ(account.lastUpdateTime, T0 + 864);
    EXPECT_EQ(account.stakedAmount, Tokens(100));

    ASSERT_TRUE(Checkpoint(account, T0 + 2 * 864));
    EXPECT_EQ(account.unclaimedRewards, Tokens(2));
}

TEST(AccrualTest, CheckpointWithoutStakeOnlyMovesClock) {
    StakeAccount account;
    ASSERT_TRUE(Checkpoint(account, T0));
    EXPECT_TRUE(account.unclaimedRewards.IsZero());
    EXPECT_EQ(account.lastUpdateTime, T0);
}

TEST(AccrualTest, CheckpointIgnoresClockRegression) {
    StakeAccount account;
    account.stakedAmount = Tokens(100);
    account.unclaimedRewards = Tokens(3);
    account.lastUpdateTime = T0;

    ASSERT_TRUE(Checkpoint(account, T0 - 1000));
    EXPECT_EQ(account.unclaimedRewards, Tokens(3));
    EXPECT_EQ(account.lastUpdateTime, T0);

    ASSERT_TRUE(Checkpoint(account, T0));
    EXPECT_EQ(account.unclaimedRewards, Tokens(3));
}

TEST(AccrualTest, CheckpointOverflowLeavesAccountUnchanged) {
    StakeAccount account;
    account.stakedAmount = Tokens(1);
    account.unclaimedRewards = Amount::Max();
    account.lastUpdateTime = T0;
    StakeAccount before = account;

    EXPECT_FALSE(Checkpoint(account, T0 + SECONDS_PER_DAY));
    EXPECT_EQ(account, before);
}

TEST(AccrualTest, CheckpointIsPathIndependent) {
    StakeAccount once;
    once.stakedAmount = Tokens(100);
    once.lastUpdateTime = T0;
    StakeAccount split = once;

    ASSERT_TRUE(Checkpoint(once, T0 + 4 * 864));
    for (int i = 1; i <= 4; ++i) {
        ASSERT_TRUE(Checkpoint(split, T0 + i * 864));
    }
    EXPECT_EQ(once, split);
}

// ============================================================================
// PendingReward
// ============================================================================

TEST(AccrualTest, PendingIncludesUnclaimedAndAccrual) {
    StakeAccount account;
    account.stakedAmount = Tokens(100);
    account.unclaimedRewards = Tokens(5);
    account.lastUpdateTime = T0;

    EXPECT_EQ(PendingReward(account, T0), Tokens(5));
    EXPECT_EQ(PendingReward(account, T0 + 864), Tokens(6));
    EXPECT_EQ(PendingReward(account, T0 - 10), Tokens(5));
}

TEST(AccrualTest, PendingSaturates) {
    StakeAccount account;
    account.stakedAmount = Tokens(1);
    account.unclaimedRewards = Amount::Max();
    account.lastUpdateTime = T0;
    EXPECT_EQ(PendingReward(account, T0 + SECONDS_PER_DAY), Amount::Max());
}

TEST(AccrualTest, AccountToString) {
    StakeAccount account;
    account.stakedAmount = Tokens(3) / Amount(2);
    account.lastUpdateTime = 42;
    EXPECT_EQ(account.ToString(), "StakeAccount(staked=1.5, unclaimed=0, lastUpdate=42)");
    EXPECT_FALSE(account.IsEmpty());
    EXPECT_TRUE(StakeAccount().IsEmpty());
}

} // namespace
} // namespace ledger
} // namespace stakeledger
