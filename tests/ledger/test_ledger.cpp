// StakeLedger - Ledger Tests
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <gtest/gtest.h>

#include <stakeledger/asset/asset.h>
#include <stakeledger/ledger/ledger.h>
#include <stakeledger/util/time.h>

#include <memory>
#include <vector>

namespace stakeledger {
namespace ledger {
namespace {

using asset::AssetPort;
using asset::AssetStatus;
using asset::IssuablePort;
using asset::TokenLedger;
using asset::TokenPort;

constexpr int64_t T0 = 1700000000;

Address MakeAddress(Byte tag) {
    Byte bytes[] = {tag};
    return Address(bytes, sizeof(bytes));
}

// ============================================================================
// Test Ports
// ============================================================================

/// Base port that can be told to fail its next calls
class FaultyPort : public AssetPort {
public:
    explicit FaultyPort(std::shared_ptr<AssetPort> inner) : inner_(std::move(inner)) {}

    AssetStatus Pull(const Address& from, const Amount& amount) override {
        if (failPull) return AssetStatus::InsufficientBalance;
        return inner_->Pull(from, amount);
    }

    AssetStatus Push(const Address& to, const Amount& amount) override {
        if (failPush) return AssetStatus::InsufficientBalance;
        return inner_->Push(to, amount);
    }

    bool failPull{false};
    bool failPush{false};

private:
    std::shared_ptr<AssetPort> inner_;
};

/// Base port that calls back into the ledger mid-operation
class ReentrantPort : public AssetPort {
public:
    explicit ReentrantPort(std::shared_ptr<AssetPort> inner) : inner_(std::move(inner)) {}

    AssetStatus Pull(const Address& from, const Amount& amount) override {
        if (target) {
            nested.push_back(target->Stake(from, amount));
            nested.push_back(target->Unstake(from, amount));
            nested.push_back(target->ClaimReward(from));
            nested.push_back(target->DepositReserve(from, amount));
        }
        return inner_->Pull(from, amount);
    }

    AssetStatus Push(const Address& to, const Amount& amount) override {
        if (target) {
            nested.push_back(target->UnlockTokens(to));
            nested.push_back(target->LockTokens(to, amount));
        }
        return inner_->Push(to, amount);
    }

    StakeLedger* target{nullptr};
    std::vector<LedgerError> nested;

private:
    std::shared_ptr<AssetPort> inner_;
};

/// Reward port that counts issuance calls and can refuse to burn
class CountingRewardPort : public IssuablePort {
public:
    explicit CountingRewardPort(std::shared_ptr<IssuablePort> inner) : inner_(std::move(inner)) {}

    AssetStatus Pull(const Address& from, const Amount& amount) override {
        return inner_->Pull(from, amount);
    }

    AssetStatus Push(const Address& to, const Amount& amount) override {
        return inner_->Push(to, amount);
    }

    AssetStatus Mint(const Address& to, const Amount& amount) override {
        ++mints;
        return inner_->Mint(to, amount);
    }

    AssetStatus Burn(const Address& from, const Amount& amount) override {
        ++burns;
        if (refuseBurn) return AssetStatus::NotAuthorized;
        return inner_->Burn(from, amount);
    }

    AssetStatus CheckBurn(const Address& from, const Amount& amount) const override {
        if (refuseBurn) return AssetStatus::NotAuthorized;
        return inner_->CheckBurn(from, amount);
    }

    int mints{0};
    int burns{0};
    bool refuseBurn{false};

private:
    std::shared_ptr<IssuablePort> inner_;
};

// ============================================================================
// Fixture
// ============================================================================

class StakeLedgerTest : public ::testing::Test {
protected:
    const Address self = MakeAddress(0x5e);
    const Address admin = MakeAddress(0xad);
    const Address faucet = MakeAddress(0xfa);
    const Address alice = MakeAddress(0xa1);
    const Address bob = MakeAddress(0xb0);

    std::shared_ptr<TokenLedger> baseToken =
        std::make_shared<TokenLedger>("Base Asset", "BASE", faucet);
    std::shared_ptr<TokenLedger> rewardToken =
        std::make_shared<TokenLedger>("Reward Asset", "RWD", self);
    std::shared_ptr<TokenPort> basePort = std::make_shared<TokenPort>(baseToken, self);
    std::shared_ptr<TokenPort> rewardPort = std::make_shared<TokenPort>(rewardToken, self);

    std::unique_ptr<StakeLedger> ledger;
    std::vector<LedgerEvent> events;

    void SetUp() override {
        util::SetMockTime(T0);
        util::EnableMockTime();
        Build(basePort);
    }

    void TearDown() override {
        ledger.reset();
        util::DisableMockTime();
        util::SetMockTime(0);
    }

    void Build(std::shared_ptr<AssetPort> base, std::shared_ptr<IssuablePort> reward = nullptr) {
        if (!reward) {
            reward = rewardPort;
        }
        ledger = std::make_unique<StakeLedger>(self, admin, std::move(base), std::move(reward));
        ledger->SetEventCallback([this](const LedgerEvent& event) { events.push_back(event); });
    }

    /// Give `who` base tokens and let the ledger pull them
    void Fund(const Address& who, uint64_t tokens) {
        ASSERT_EQ(baseToken->Mint(faucet, who, Tokens(tokens)), AssetStatus::Ok);
        ASSERT_EQ(baseToken->Approve(who, self, Amount::Max()), AssetStatus::Ok);
    }

    void Advance(int64_t seconds) {
        util::AdvanceMockTime(util::Seconds{seconds});
    }

    /// Stake 100, wait a day and claim: leaves `who` holding 100 reward tokens
    void EarnRewards(const Address& who) {
        Fund(who, 100);
        ASSERT_EQ(ledger->Stake(who, Tokens(100)), LedgerError::OK);
        Advance(SECONDS_PER_DAY);
        ASSERT_EQ(ledger->ClaimReward(who), LedgerError::OK);
        ASSERT_EQ(rewardToken->Approve(who, self, Amount::Max()), AssetStatus::Ok);
    }

    void FundReserve(uint64_t tokens) {
        Fund(admin, tokens);
        ASSERT_EQ(ledger->DepositReserve(admin, Tokens(tokens)), LedgerError::OK);
    }

    /// Base held by the ledger must equal stakes plus reserve
    void ExpectBaseCustodyBalanced() {
        EXPECT_EQ(basePort->CustodyBalance(), ledger->GetTotalStaked() + ledger->GetReserve());
    }
};

// ============================================================================
// Stake
// ============================================================================

TEST_F(StakeLedgerTest, StakePullsBaseIntoCustody) {
    Fund(alice, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(100)), LedgerError::OK);

    StakeAccount account = ledger->GetAccount(alice);
    EXPECT_EQ(account.stakedAmount, Tokens(100));
    EXPECT_TRUE(account.unclaimedRewards.IsZero());
    EXPECT_EQ(account.lastUpdateTime, T0);
    EXPECT_EQ(ledger->GetTotalStaked(), Tokens(100));
    EXPECT_EQ(ledger->GetAccountCount(), 1u);
    EXPECT_TRUE(baseToken->BalanceOf(alice).IsZero());
    EXPECT_EQ(basePort->CustodyBalance(), Tokens(100));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, LedgerEventType::Staked);
    EXPECT_EQ(events[0].account, alice);
    EXPECT_EQ(events[0].amount, Tokens(100));
    EXPECT_EQ(events[0].timestamp, T0);
}

TEST_F(StakeLedgerTest, StakeZeroRejected) {
    Fund(alice, 1);
    EXPECT_EQ(ledger->Stake(alice, Amount()), LedgerError::InvalidAmount);
    EXPECT_EQ(ledger->GetAccountCount(), 0u);
    EXPECT_TRUE(events.empty());
}

TEST_F(StakeLedgerTest, StakeWithoutAllowanceRejected) {
    ASSERT_EQ(baseToken->Mint(faucet, alice, Tokens(10)), AssetStatus::Ok);
    EXPECT_EQ(ledger->Stake(alice, Tokens(10)), LedgerError::InsufficientAssetBalance);
    EXPECT_TRUE(ledger->GetTotalStaked().IsZero());
    EXPECT_EQ(ledger->GetAccountCount(), 0u);
    EXPECT_EQ(baseToken->BalanceOf(alice), Tokens(10));
    EXPECT_TRUE(events.empty());
}

TEST_F(StakeLedgerTest, StakeBeyondBalanceRejected) {
    Fund(alice, 10);
    EXPECT_EQ(ledger->Stake(alice, Tokens(11)), LedgerError::InsufficientAssetBalance);
    EXPECT_TRUE(ledger->GetTotalStaked().IsZero());
}

TEST_F(StakeLedgerTest, SecondStakeCheckpointsFirst) {
    Fund(alice, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(50)), LedgerError::OK);
    Advance(864);
    ASSERT_EQ(ledger->Stake(alice, Tokens(50)), LedgerError::OK);

    StakeAccount account = ledger->GetAccount(alice);
    EXPECT_EQ(account.stakedAmount, Tokens(100));
    EXPECT_EQ(account.unclaimedRewards, Tokens(1) / Amount(2));
    EXPECT_EQ(account.lastUpdateTime, T0 + 864);

    Advance(864);
    EXPECT_EQ(ledger->PendingReward(alice), Tokens(3) / Amount(2));
}

// ============================================================================
// Accrual and Claims
// ============================================================================

TEST_F(StakeLedgerTest, RewardsAccrueOverTime) {
    Fund(alice, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(100)), LedgerError::OK);
    EXPECT_TRUE(ledger->PendingReward(alice).IsZero());

    Advance(864);
    EXPECT_EQ(ledger->PendingReward(alice), Tokens(1));

    Advance(SECONDS_PER_DAY - 864);
    EXPECT_EQ(ledger->PendingReward(alice), Tokens(100));
    EXPECT_TRUE(ledger->PendingReward(bob).IsZero());
}

TEST_F(StakeLedgerTest, ClaimMintsAccruedRewards) {
    Fund(alice, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(100)), LedgerError::OK);
    Advance(SECONDS_PER_DAY);

    Amount claimed;
    ASSERT_EQ(ledger->ClaimReward(alice, &claimed), LedgerError::OK);
    EXPECT_EQ(claimed, Tokens(100));
    EXPECT_EQ(rewardToken->BalanceOf(alice), Tokens(100));
    EXPECT_EQ(rewardToken->TotalSupply(), Tokens(100));
    EXPECT_EQ(ledger->GetTotalMinted(), Tokens(100));

    StakeAccount account = ledger->GetAccount(alice);
    EXPECT_TRUE(account.unclaimedRewards.IsZero());
    EXPECT_EQ(account.lastUpdateTime, T0 + SECONDS_PER_DAY);
    EXPECT_EQ(account.stakedAmount, Tokens(100));

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].type, LedgerEventType::RewardClaimed);
    EXPECT_EQ(events[1].amount, Tokens(100));

    EXPECT_EQ(ledger->ClaimReward(alice), LedgerError::NoReward);
}

TEST_F(StakeLedgerTest, ClaimWithoutStakeHasNoReward) {
    EXPECT_EQ(ledger->ClaimReward(alice), LedgerError::NoReward);
    EXPECT_EQ(ledger->GetAccountCount(), 0u);
    EXPECT_TRUE(rewardToken->TotalSupply().IsZero());
}

TEST_F(StakeLedgerTest, ClaimKeepsRewardsAfterFullUnstake) {
    Fund(alice, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(100)), LedgerError::OK);
    Advance(864);
    ASSERT_EQ(ledger->Unstake(alice, Tokens(100)), LedgerError::OK);
    Advance(SECONDS_PER_DAY);

    EXPECT_EQ(ledger->PendingReward(alice), Tokens(1));
    Amount claimed;
    ASSERT_EQ(ledger->ClaimReward(alice, &claimed), LedgerError::OK);
    EXPECT_EQ(claimed, Tokens(1));
}

TEST_F(StakeLedgerTest, ClockRegressionAccruesNothing) {
    Fund(alice, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(50)), LedgerError::OK);
    util::SetMockTime(T0 - 500);

    EXPECT_TRUE(ledger->PendingReward(alice).IsZero());
    ASSERT_EQ(ledger->Stake(alice, Tokens(50)), LedgerError::OK);
    EXPECT_EQ(ledger->GetAccount(alice).lastUpdateTime, T0);
    EXPECT_EQ(ledger->ClaimReward(alice), LedgerError::NoReward);
}

// ============================================================================
// Unstake
// ============================================================================

TEST_F(StakeLedgerTest, UnstakeReturnsBaseAndCheckpoints) {
    Fund(alice, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(100)), LedgerError::OK);
    Advance(864);
    ASSERT_EQ(ledger->Unstake(alice, Tokens(40)), LedgerError::OK);

    StakeAccount account = ledger->GetAccount(alice);
    EXPECT_EQ(account.stakedAmount, Tokens(60));
    EXPECT_EQ(account.unclaimedRewards, Tokens(1));
    EXPECT_EQ(ledger->GetTotalStaked(), Tokens(60));
    EXPECT_EQ(baseToken->BalanceOf(alice), Tokens(40));

    // 1 + 60 * 864 / 86400
    Advance(864);
    EXPECT_EQ(ledger->PendingReward(alice), ParseUnits("1.6", TOKEN_DECIMALS).value());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].type, LedgerEventType::Unstaked);
    EXPECT_EQ(events[1].amount, Tokens(40));
}

TEST_F(StakeLedgerTest, UnstakeValidation) {
    Fund(alice, 10);
    ASSERT_EQ(ledger->Stake(alice, Tokens(10)), LedgerError::OK);

    EXPECT_EQ(ledger->Unstake(alice, Amount()), LedgerError::InvalidAmount);
    EXPECT_EQ(ledger->Unstake(alice, Tokens(11)), LedgerError::InsufficientStake);
    EXPECT_EQ(ledger->Unstake(bob, Tokens(1)), LedgerError::InsufficientStake);
    EXPECT_EQ(ledger->GetTotalStaked(), Tokens(10));
    EXPECT_EQ(ledger->GetAccountCount(), 1u);
}

TEST_F(StakeLedgerTest, UnstakePushFailureLeavesStateUnchanged) {
    auto faulty = std::make_shared<FaultyPort>(basePort);
    Build(faulty);
    Fund(alice, 10);
    ASSERT_EQ(ledger->Stake(alice, Tokens(10)), LedgerError::OK);
    Advance(864);
    StakeAccount before = ledger->GetAccount(alice);

    faulty->failPush = true;
    EXPECT_EQ(ledger->Unstake(alice, Tokens(5)), LedgerError::InsufficientAssetBalance);
    EXPECT_EQ(ledger->GetAccount(alice), before);
    EXPECT_EQ(ledger->GetTotalStaked(), Tokens(10));
    EXPECT_EQ(events.size(), 1u);
}

// ============================================================================
// Share
// ============================================================================

TEST_F(StakeLedgerTest, UserShare) {
    EXPECT_TRUE(ledger->GetUserShare(alice).IsZero());

    Fund(alice, 75);
    Fund(bob, 25);
    ASSERT_EQ(ledger->Stake(alice, Tokens(75)), LedgerError::OK);
    ASSERT_EQ(ledger->Stake(bob, Tokens(25)), LedgerError::OK);

    EXPECT_EQ(ledger->GetUserShare(alice), ParseUnits("0.75", TOKEN_DECIMALS).value());
    EXPECT_EQ(ledger->GetUserShare(bob), ParseUnits("0.25", TOKEN_DECIMALS).value());
    EXPECT_TRUE(ledger->GetUserShare(admin).IsZero());
}

// ============================================================================
// Lock
// ============================================================================

TEST_F(StakeLedgerTest, LockPullsRewardTokens) {
    EarnRewards(alice);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);

    VestingLock lock = ledger->GetLock(alice);
    EXPECT_EQ(lock.amount, Tokens(50));
    EXPECT_EQ(lock.startTime, T0 + SECONDS_PER_DAY);
    EXPECT_EQ(ledger->GetActiveLockCount(), 1u);
    EXPECT_EQ(rewardToken->BalanceOf(alice), Tokens(50));
    EXPECT_EQ(rewardPort->CustodyBalance(), Tokens(50));
    EXPECT_EQ(events.back().type, LedgerEventType::TokenLocked);
    EXPECT_EQ(events.back().amount, Tokens(50));
}

TEST_F(StakeLedgerTest, LockValidation) {
    EarnRewards(alice);
    EXPECT_EQ(ledger->LockTokens(alice, Amount()), LedgerError::InvalidAmount);
    EXPECT_EQ(ledger->LockTokens(alice, Tokens(101)), LedgerError::InsufficientAssetBalance);
    EXPECT_EQ(ledger->LockTokens(bob, Tokens(1)), LedgerError::InsufficientAssetBalance);
    EXPECT_EQ(ledger->GetActiveLockCount(), 0u);

    ASSERT_EQ(ledger->LockTokens(alice, Tokens(10)), LedgerError::OK);
    EXPECT_EQ(ledger->LockTokens(alice, Tokens(10)), LedgerError::LockAlreadyActive);
    EXPECT_EQ(ledger->GetLock(alice).amount, Tokens(10));
}

// ============================================================================
// Unlock
// ============================================================================

TEST_F(StakeLedgerTest, UnlockWithoutLock) {
    EXPECT_EQ(ledger->UnlockTokens(alice), LedgerError::NoLockActive);
    EXPECT_FALSE(ledger->PreviewUnlock(alice).has_value());
}

TEST_F(StakeLedgerTest, UnlockHalfwayPaysHalf) {
    EarnRewards(alice);
    FundReserve(100);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);
    ASSERT_EQ(ledger->Unstake(alice, Tokens(100)), LedgerError::OK);
    Advance(15 * SECONDS_PER_DAY);

    auto preview = ledger->PreviewUnlock(alice);
    ASSERT_TRUE(preview.has_value());
    EXPECT_EQ(preview->payout, Tokens(25));

    UnlockQuote quote;
    ASSERT_EQ(ledger->UnlockTokens(alice, &quote), LedgerError::OK);
    EXPECT_EQ(quote.payout, Tokens(25));
    EXPECT_EQ(quote.penalty, Tokens(25));
    EXPECT_FALSE(quote.matured);

    EXPECT_EQ(baseToken->BalanceOf(alice), Tokens(125));
    EXPECT_EQ(ledger->GetReserve(), Tokens(75));
    EXPECT_EQ(ledger->GetTotalPaidOut(), Tokens(25));
    EXPECT_EQ(ledger->GetTotalBurned(), Tokens(25));
    EXPECT_EQ(rewardToken->TotalSupply(), Tokens(75));
    // The payout share of the locked reward stays in custody
    EXPECT_EQ(rewardPort->CustodyBalance(), Tokens(25));
    EXPECT_FALSE(ledger->GetLock(alice).IsActive());
    EXPECT_EQ(ledger->GetActiveLockCount(), 0u);

    const LedgerEvent& event = events.back();
    EXPECT_EQ(event.type, LedgerEventType::TokenUnlocked);
    EXPECT_EQ(event.amount, Tokens(25));
    EXPECT_EQ(event.penalty, Tokens(25));

    EXPECT_EQ(ledger->UnlockTokens(alice), LedgerError::NoLockActive);
    ExpectBaseCustodyBalanced();
}

TEST_F(StakeLedgerTest, UnlockAfterMaturityPaysInFull) {
    EarnRewards(alice);
    FundReserve(100);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);
    Advance(LOCK_DURATION);

    UnlockQuote quote;
    ASSERT_EQ(ledger->UnlockTokens(alice, &quote), LedgerError::OK);
    EXPECT_TRUE(quote.matured);
    EXPECT_EQ(quote.payout, Tokens(50));
    EXPECT_TRUE(quote.penalty.IsZero());
    EXPECT_TRUE(ledger->GetTotalBurned().IsZero());
    EXPECT_EQ(rewardToken->TotalSupply(), Tokens(100));
    EXPECT_EQ(ledger->GetReserve(), Tokens(50));
}

TEST_F(StakeLedgerTest, ImmediateUnlockBurnsEverything) {
    EarnRewards(alice);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);

    // No payout, so an empty reserve is enough
    UnlockQuote quote;
    ASSERT_EQ(ledger->UnlockTokens(alice, &quote), LedgerError::OK);
    EXPECT_TRUE(quote.payout.IsZero());
    EXPECT_EQ(quote.penalty, Tokens(50));
    EXPECT_EQ(rewardToken->TotalSupply(), Tokens(50));
    EXPECT_TRUE(rewardPort->CustodyBalance().IsZero());
    EXPECT_TRUE(ledger->GetTotalPaidOut().IsZero());
}

TEST_F(StakeLedgerTest, UnlockNeedsReserve) {
    EarnRewards(alice);
    FundReserve(10);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);
    Advance(LOCK_DURATION);
    size_t eventCount = events.size();

    EXPECT_EQ(ledger->UnlockTokens(alice), LedgerError::InsufficientReserve);
    EXPECT_TRUE(ledger->GetLock(alice).IsActive());
    EXPECT_EQ(ledger->GetReserve(), Tokens(10));
    EXPECT_EQ(rewardToken->TotalSupply(), Tokens(100));
    EXPECT_EQ(events.size(), eventCount);

    FundReserve(40);
    EXPECT_EQ(ledger->UnlockTokens(alice), LedgerError::OK);
    EXPECT_TRUE(ledger->GetReserve().IsZero());
}

TEST_F(StakeLedgerTest, EarlyUnlockNeedsReserve) {
    EarnRewards(alice);
    FundReserve(10);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);
    Advance(15 * SECONDS_PER_DAY);
    size_t eventCount = events.size();

    // Discounted payout of 25 still exceeds the reserve
    EXPECT_EQ(ledger->UnlockTokens(alice), LedgerError::InsufficientReserve);
    EXPECT_EQ(ledger->GetLock(alice).amount, Tokens(50));
    EXPECT_EQ(ledger->GetReserve(), Tokens(10));
    EXPECT_EQ(rewardToken->TotalSupply(), Tokens(100));
    EXPECT_EQ(rewardPort->CustodyBalance(), Tokens(50));
    EXPECT_EQ(basePort->CustodyBalance(), Tokens(110));
    EXPECT_EQ(baseToken->BalanceOf(alice), Tokens(0));
    EXPECT_TRUE(ledger->GetTotalBurned().IsZero());
    EXPECT_EQ(events.size(), eventCount);

    FundReserve(15);
    UnlockQuote quote;
    ASSERT_EQ(ledger->UnlockTokens(alice, &quote), LedgerError::OK);
    EXPECT_EQ(quote.payout, Tokens(25));
    EXPECT_EQ(baseToken->BalanceOf(alice), Tokens(25));
    EXPECT_TRUE(ledger->GetReserve().IsZero());
}

TEST_F(StakeLedgerTest, UnlockPushFailureBurnsNothing) {
    auto faulty = std::make_shared<FaultyPort>(basePort);
    auto counting = std::make_shared<CountingRewardPort>(rewardPort);
    Build(faulty, counting);
    EarnRewards(alice);
    FundReserve(100);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);
    Advance(15 * SECONDS_PER_DAY);
    int mintsBefore = counting->mints;

    faulty->failPush = true;
    EXPECT_EQ(ledger->UnlockTokens(alice), LedgerError::InsufficientAssetBalance);
    EXPECT_EQ(counting->mints, mintsBefore);
    EXPECT_EQ(counting->burns, 0);
    EXPECT_EQ(ledger->GetLock(alice).amount, Tokens(50));
    EXPECT_EQ(ledger->GetReserve(), Tokens(100));
    EXPECT_TRUE(ledger->GetTotalBurned().IsZero());
    EXPECT_EQ(ledger->GetTotalMinted(), Tokens(100));
    EXPECT_EQ(rewardToken->TotalSupply(), Tokens(100));
    EXPECT_EQ(rewardPort->CustodyBalance(), Tokens(50));

    faulty->failPush = false;
    ASSERT_EQ(ledger->UnlockTokens(alice), LedgerError::OK);
    EXPECT_EQ(counting->mints, mintsBefore);
    EXPECT_EQ(counting->burns, 1);
    EXPECT_EQ(rewardToken->TotalSupply(), Tokens(75));
}

TEST_F(StakeLedgerTest, UnburnablePenaltyStopsUnlockBeforePayout) {
    auto counting = std::make_shared<CountingRewardPort>(rewardPort);
    Build(basePort, counting);
    EarnRewards(alice);
    FundReserve(100);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);
    Advance(15 * SECONDS_PER_DAY);

    counting->refuseBurn = true;
    EXPECT_EQ(ledger->UnlockTokens(alice), LedgerError::NotAuthorized);
    EXPECT_EQ(counting->burns, 0);
    EXPECT_TRUE(baseToken->BalanceOf(alice).IsZero());
    EXPECT_EQ(ledger->GetReserve(), Tokens(100));
    EXPECT_TRUE(ledger->GetLock(alice).IsActive());
    ExpectBaseCustodyBalanced();
}

TEST_F(StakeLedgerTest, UnlockCheckpointsCaller) {
    EarnRewards(alice);
    FundReserve(100);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);
    EXPECT_EQ(ledger->GetAccount(alice).lastUpdateTime, T0 + SECONDS_PER_DAY);

    Advance(LOCK_DURATION);
    ASSERT_EQ(ledger->UnlockTokens(alice), LedgerError::OK);
    StakeAccount account = ledger->GetAccount(alice);
    EXPECT_EQ(account.lastUpdateTime, T0 + SECONDS_PER_DAY + LOCK_DURATION);
    EXPECT_EQ(account.unclaimedRewards, Tokens(3000));
    EXPECT_EQ(ledger->PendingReward(alice), Tokens(3000));
}

TEST_F(StakeLedgerTest, FailedUnlockDoesNotCheckpoint) {
    EarnRewards(alice);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(50)), LedgerError::OK);
    Advance(LOCK_DURATION);

    EXPECT_EQ(ledger->UnlockTokens(alice), LedgerError::InsufficientReserve);
    EXPECT_EQ(ledger->GetAccount(alice).lastUpdateTime, T0 + SECONDS_PER_DAY);
    EXPECT_TRUE(ledger->GetAccount(alice).unclaimedRewards.IsZero());
}

// ============================================================================
// Reserve
// ============================================================================

TEST_F(StakeLedgerTest, DepositReserve) {
    Fund(admin, 100);
    ASSERT_EQ(ledger->DepositReserve(admin, Tokens(60)), LedgerError::OK);
    EXPECT_EQ(ledger->GetReserve(), Tokens(60));
    EXPECT_EQ(ledger->GetTotalDeposited(), Tokens(60));
    EXPECT_EQ(baseToken->BalanceOf(admin), Tokens(40));
    EXPECT_TRUE(ledger->GetTotalStaked().IsZero());

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, LedgerEventType::ReserveDeposited);
    EXPECT_EQ(events[0].ToString(), "ReserveDeposited(60)");
    ExpectBaseCustodyBalanced();
}

TEST_F(StakeLedgerTest, DepositCheckpointsAdministrator) {
    Fund(admin, 100);
    ASSERT_EQ(ledger->Stake(admin, Tokens(50)), LedgerError::OK);
    Advance(864);
    ASSERT_EQ(ledger->DepositReserve(admin, Tokens(10)), LedgerError::OK);

    StakeAccount account = ledger->GetAccount(admin);
    EXPECT_EQ(account.lastUpdateTime, T0 + 864);
    EXPECT_EQ(account.unclaimedRewards, ParseUnits("0.5", TOKEN_DECIMALS).value());
    EXPECT_EQ(account.stakedAmount, Tokens(50));
    EXPECT_EQ(ledger->GetAccountCount(), 1u);
}

TEST_F(StakeLedgerTest, DepositValidation) {
    Fund(alice, 10);
    EXPECT_EQ(ledger->DepositReserve(alice, Amount()), LedgerError::InvalidAmount);
    EXPECT_EQ(ledger->DepositReserve(alice, Tokens(10)), LedgerError::NotAuthorized);
    EXPECT_EQ(ledger->DepositReserve(admin, Tokens(10)), LedgerError::InsufficientAssetBalance);
    EXPECT_TRUE(ledger->GetReserve().IsZero());
    EXPECT_EQ(ledger->GetAdministrator(), admin);
}

TEST_F(StakeLedgerTest, ReserveAndStakesStaySeparate) {
    Fund(alice, 100);
    FundReserve(30);
    ASSERT_EQ(ledger->Stake(alice, Tokens(100)), LedgerError::OK);
    ExpectBaseCustodyBalanced();

    // Unstake draws on stakes only
    ASSERT_EQ(ledger->Unstake(alice, Tokens(100)), LedgerError::OK);
    EXPECT_EQ(ledger->GetReserve(), Tokens(30));
    EXPECT_EQ(ledger->Unstake(alice, Tokens(1)), LedgerError::InsufficientStake);
    ExpectBaseCustodyBalanced();
}

// ============================================================================
// Reentrancy
// ============================================================================

TEST_F(StakeLedgerTest, NestedCallsFromAssetPortRejected) {
    auto reentrant = std::make_shared<ReentrantPort>(basePort);
    Build(reentrant);
    reentrant->target = ledger.get();

    Fund(alice, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(10)), LedgerError::OK);
    ASSERT_EQ(ledger->Unstake(alice, Tokens(10)), LedgerError::OK);

    ASSERT_EQ(reentrant->nested.size(), 6u);
    for (LedgerError error : reentrant->nested) {
        EXPECT_EQ(error, LedgerError::ReentrantCall);
    }
    EXPECT_TRUE(ledger->GetTotalStaked().IsZero());
    EXPECT_EQ(baseToken->BalanceOf(alice), Tokens(100));
    EXPECT_EQ(events.size(), 2u);

    // Guard released after the outer call returns
    reentrant->target = nullptr;
    EXPECT_EQ(ledger->Stake(alice, Tokens(1)), LedgerError::OK);
}

TEST_F(StakeLedgerTest, EventCallbackCannotReenter) {
    std::vector<LedgerError> nested;
    Amount observedTotal;
    ledger->SetEventCallback([&](const LedgerEvent&) {
        observedTotal = ledger->GetTotalStaked();
        nested.push_back(ledger->Stake(alice, Tokens(1)));
    });

    Fund(alice, 10);
    ASSERT_EQ(ledger->Stake(alice, Tokens(5)), LedgerError::OK);
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_EQ(nested[0], LedgerError::ReentrantCall);
    EXPECT_EQ(observedTotal, Tokens(5));
    EXPECT_EQ(ledger->GetTotalStaked(), Tokens(5));
}

// ============================================================================
// Conservation
// ============================================================================

TEST_F(StakeLedgerTest, TotalStakedMatchesAccounts) {
    Fund(alice, 100);
    Fund(bob, 100);
    ASSERT_EQ(ledger->Stake(alice, Tokens(30)), LedgerError::OK);
    ASSERT_EQ(ledger->Stake(bob, Tokens(70)), LedgerError::OK);
    Advance(3600);
    ASSERT_EQ(ledger->Unstake(alice, Tokens(10)), LedgerError::OK);
    EXPECT_EQ(ledger->Unstake(bob, Tokens(71)), LedgerError::InsufficientStake);

    LedgerState state = ledger->ExportState();
    Amount sum;
    for (const auto& [address, account] : state.accounts) {
        sum += account.stakedAmount;
    }
    EXPECT_EQ(sum, state.totalStaked);
    EXPECT_EQ(state.totalStaked, Tokens(90));
    ExpectBaseCustodyBalanced();
}

// ============================================================================
// State
// ============================================================================

TEST_F(StakeLedgerTest, ExportImportRoundTrip) {
    EarnRewards(alice);
    FundReserve(20);
    ASSERT_EQ(ledger->LockTokens(alice, Tokens(40)), LedgerError::OK);
    LedgerState state = ledger->ExportState();

    StakeLedger restored(self, admin, basePort, rewardPort);
    ASSERT_TRUE(restored.ImportState(state));
    EXPECT_EQ(restored.GetAccount(alice), ledger->GetAccount(alice));
    EXPECT_EQ(restored.GetLock(alice), ledger->GetLock(alice));
    EXPECT_EQ(restored.GetTotalStaked(), Tokens(100));
    EXPECT_EQ(restored.GetReserve(), Tokens(20));
    EXPECT_EQ(restored.GetTotalDeposited(), Tokens(20));
    EXPECT_EQ(restored.GetTotalMinted(), Tokens(100));
}

TEST_F(StakeLedgerTest, ImportRejectsStakeMismatch) {
    LedgerState state;
    state.accounts[alice].stakedAmount = Tokens(5);
    state.totalStaked = Tokens(6);
    EXPECT_FALSE(ledger->ImportState(state));
    EXPECT_EQ(ledger->GetAccountCount(), 0u);
}

// ============================================================================
// Strings
// ============================================================================

TEST(LedgerStringsTest, EventToString) {
    Byte bytes[] = {0xab, 0xcd};
    LedgerEvent event{LedgerEventType::Staked, Address(bytes, sizeof(bytes)), Tokens(100),
                      Amount(), T0};
    EXPECT_EQ(event.ToString(), "Staked(0xabcd...0000, 100)");

    event.type = LedgerEventType::TokenUnlocked;
    event.amount = Tokens(25);
    event.penalty = Tokens(25);
    EXPECT_EQ(event.ToString(), "TokenUnlocked(0xabcd...0000, 25, penalty=25)");
}

TEST(LedgerStringsTest, ErrorStrings) {
    EXPECT_STREQ(LedgerErrorToString(LedgerError::OK), "OK");
    EXPECT_STREQ(LedgerErrorToString(LedgerError::ReentrantCall), "ReentrantCall");
    EXPECT_STREQ(LedgerErrorToString(LedgerError::InsufficientReserve), "InsufficientReserve");
    EXPECT_STREQ(LedgerEventTypeToString(LedgerEventType::ReserveDeposited), "ReserveDeposited");
}

TEST(LedgerStringsTest, AssetStatusMapping) {
    EXPECT_EQ(FromAssetStatus(AssetStatus::Ok), LedgerError::OK);
    EXPECT_EQ(FromAssetStatus(AssetStatus::InsufficientBalance),
              LedgerError::InsufficientAssetBalance);
    EXPECT_EQ(FromAssetStatus(AssetStatus::InsufficientAllowance),
              LedgerError::InsufficientAssetBalance);
    EXPECT_EQ(FromAssetStatus(AssetStatus::NotAuthorized), LedgerError::NotAuthorized);
    EXPECT_EQ(FromAssetStatus(AssetStatus::Overflow), LedgerError::ArithmeticOverflow);
}

} // namespace
} // namespace ledger
} // namespace stakeledger
