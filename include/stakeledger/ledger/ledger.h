// StakeLedger - Staking Ledger
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Time-weighted staking with a vesting exit.
//
// Key features:
// - Continuous reward accrual per staked unit and second
// - Reward claims minted on demand
// - Vesting locks that convert rewards back into the base asset,
//   with a linear penalty for early exit
// - An administrator-funded reserve bounding all unlock payouts
//
// Every mutating operation is serialized, rejects reentrant entry, and
// either commits all of its effects (ledger state and asset movement)
// or none of them.

#ifndef STAKELEDGER_LEDGER_LEDGER_H
#define STAKELEDGER_LEDGER_LEDGER_H

#include <stakeledger/asset/asset.h>
#include <stakeledger/core/types.h>
#include <stakeledger/ledger/accrual.h>
#include <stakeledger/ledger/reserve.h>
#include <stakeledger/ledger/vesting.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Errors
// ============================================================================

enum class LedgerError {
    OK,

    /// Zero amount where a positive one is required
    InvalidAmount,

    /// Unstake larger than the staked balance
    InsufficientStake,

    /// Unlock payout larger than the reserve
    InsufficientReserve,

    /// Asset pull/push failed for lack of balance or allowance
    InsufficientAssetBalance,

    /// Claim with nothing accrued
    NoReward,

    /// Unlock without an outstanding lock
    NoLockActive,

    /// Lock while one is outstanding
    LockAlreadyActive,

    /// Caller lacks the required capability
    NotAuthorized,

    /// Mutating call made while another is in flight on this thread
    ReentrantCall,

    /// A balance or counter would exceed the Amount range
    ArithmeticOverflow
};

const char* LedgerErrorToString(LedgerError error);

/// Ledger error for a failed asset call
LedgerError FromAssetStatus(asset::AssetStatus status);

// ============================================================================
// Events
// ============================================================================

enum class LedgerEventType {
    Staked,
    Unstaked,
    RewardClaimed,
    TokenLocked,
    TokenUnlocked,
    ReserveDeposited
};

const char* LedgerEventTypeToString(LedgerEventType type);

/**
 * Emitted once per successful mutating operation.
 */
struct LedgerEvent {
    LedgerEventType type{LedgerEventType::Staked};

    /// Caller of the operation (the administrator for ReserveDeposited)
    Address account;

    /// Staked/unstaked/claimed/locked/deposited amount, or the unlock payout
    Amount amount;

    /// Unlock penalty (zero for other events)
    Amount penalty;

    int64_t timestamp{0};

    std::string ToString() const;
};

// ============================================================================
// Ledger State
// ============================================================================

/// Persistable snapshot of a StakeLedger
struct LedgerState {
    std::map<Address, StakeAccount> accounts;
    std::map<Address, VestingLock> locks;
    Amount totalStaked;
    Amount reserve;
    Amount totalDeposited;
    Amount totalPaidOut;
    Amount totalBurned;
    Amount totalMinted;
};

// ============================================================================
// Stake Ledger
// ============================================================================

class StakeLedger {
public:
    using EventCallback = std::function<void(const LedgerEvent&)>;

    /**
     * @param self Ledger identity: custody address for both assets and
     *             issuer of the reward asset
     * @param administrator The only address allowed to fund the reserve
     * @param baseAsset Custody port for the base asset
     * @param rewardAsset Custody and issuance port for the reward asset
     */
    StakeLedger(const Address& self,
                const Address& administrator,
                std::shared_ptr<asset::AssetPort> baseAsset,
                std::shared_ptr<asset::IssuablePort> rewardAsset);
    ~StakeLedger();

    StakeLedger(const StakeLedger&) = delete;
    StakeLedger& operator=(const StakeLedger&) = delete;

    // === Mutating Operations ===

    /// Stake base asset pulled from the caller
    LedgerError Stake(const Address& caller, const Amount& amount);

    /// Return staked base asset to the caller
    LedgerError Unstake(const Address& caller, const Amount& amount);

    /// Mint all accrued rewards to the caller
    LedgerError ClaimReward(const Address& caller, Amount* claimed = nullptr);

    /// Lock reward asset pulled from the caller into a vesting schedule.
    /// The only mutating operation that does not checkpoint the caller.
    LedgerError LockTokens(const Address& caller, const Amount& amount);

    /// Settle the caller's lock: pay from the reserve, then burn the penalty
    LedgerError UnlockTokens(const Address& caller, UnlockQuote* result = nullptr);

    /// Fund the reserve with base asset pulled from the administrator
    LedgerError DepositReserve(const Address& caller, const Amount& amount);

    // === Queries ===

    /// Unclaimed plus accrued rewards as of now
    Amount PendingReward(const Address& account) const;

    /// stakedAmount * REWARD_RATE / totalStaked, or 0 with nothing staked
    Amount GetUserShare(const Address& account) const;

    /// What UnlockTokens would do now; nullopt without an active lock
    std::optional<UnlockQuote> PreviewUnlock(const Address& account) const;

    StakeAccount GetAccount(const Address& account) const;
    VestingLock GetLock(const Address& account) const;

    Amount GetTotalStaked() const;
    Amount GetReserve() const;
    size_t GetAccountCount() const;
    size_t GetActiveLockCount() const;

    Amount GetTotalDeposited() const;
    Amount GetTotalPaidOut() const;
    Amount GetTotalBurned() const;
    Amount GetTotalMinted() const;

    const Address& GetAddress() const { return self_; }
    const Address& GetAdministrator() const { return administrator_; }

    // === Events ===

    /// Called after each successful operation, before it returns
    void SetEventCallback(EventCallback callback);

    // === State ===

    LedgerState ExportState() const;

    /**
     * Replace all ledger state. Rejected (returning false) while an
     * operation is in flight or if totalStaked differs from the sum of
     * account stakes.
     */
    bool ImportState(const LedgerState& state);

private:
    class ReentrancyGuard;

    StakeAccount LoadAccount(const Address& account) const;
    void Emit(const LedgerEvent& event);

    Address self_;
    Address administrator_;
    std::shared_ptr<asset::AssetPort> base_;
    std::shared_ptr<asset::IssuablePort> reward_;

    mutable std::recursive_mutex mutex_;
    bool entered_{false};

    std::map<Address, StakeAccount> accounts_;
    std::map<Address, VestingLock> locks_;
    Amount totalStaked_;
    ReserveManager reserve_;
    Amount totalBurned_;
    Amount totalMinted_;

    EventCallback eventCallback_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_LEDGER_H
