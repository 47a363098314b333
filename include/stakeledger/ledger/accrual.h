// StakeLedger - Reward Accrual
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Continuous, checkpoint-based reward accrual. Rewards are a pure function
// of (stored account, now): nothing accrues in the background, and each
// mutating ledger operation folds the accrued amount into the account
// before changing its stake.

#ifndef STAKELEDGER_LEDGER_ACCRUAL_H
#define STAKELEDGER_LEDGER_ACCRUAL_H

#include <stakeledger/core/types.h>
#include <stakeledger/util/time.h>

#include <cstdint>
#include <string>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Ledger Constants
// ============================================================================

/// Fixed-point scale shared by both assets (18 decimals)
constexpr Amount FIXED_POINT_SCALE{1000000000000000000ULL};

/// One reward unit per staked unit per day, in fixed point
constexpr Amount REWARD_RATE{1000000000000000000ULL};

constexpr int64_t SECONDS_PER_DAY = util::SECONDS_PER_DAY;

/// Vesting period after which a lock pays out in full (30 days)
constexpr int64_t LOCK_DURATION = 30 * SECONDS_PER_DAY;

// ============================================================================
// Stake Account
// ============================================================================

/**
 * Per-address staking record. Created zero-valued on first reference.
 */
struct StakeAccount {
    /// Base asset currently staked
    Amount stakedAmount;

    /// Rewards accrued up to lastUpdateTime and not yet claimed
    Amount unclaimedRewards;

    /// Time of the last checkpoint (Unix seconds)
    int64_t lastUpdateTime{0};

    bool IsEmpty() const {
        return stakedAmount.IsZero() && unclaimedRewards.IsZero();
    }

    bool operator==(const StakeAccount& other) const {
        return stakedAmount == other.stakedAmount &&
               unclaimedRewards == other.unclaimedRewards &&
               lastUpdateTime == other.lastUpdateTime;
    }

    bool operator!=(const StakeAccount& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// Accrual Engine
// ============================================================================

/**
 * Reward for holding `staked` for `elapsed` seconds:
 *   staked * elapsed * REWARD_RATE / (SECONDS_PER_DAY * FIXED_POINT_SCALE)
 *
 * Non-positive elapsed accrues zero. Returns false if the result does
 * not fit in an Amount.
 */
bool ComputeAccrual(const Amount& staked, int64_t elapsed, Amount& accrued);

/**
 * Fold rewards accrued since lastUpdateTime into unclaimedRewards and move
 * the checkpoint to `now`. A `now` earlier than the checkpoint accrues
 * nothing and leaves the checkpoint where it is.
 *
 * @return false on overflow, in which case the account is unchanged
 */
bool Checkpoint(StakeAccount& account, int64_t now);

/// unclaimedRewards plus accrual up to `now`, saturating at Amount::Max()
Amount PendingReward(const StakeAccount& account, int64_t now);

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_ACCRUAL_H
