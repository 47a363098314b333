// StakeLedger - Vesting Locks
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Locked rewards convert back into the base asset over LOCK_DURATION.
// Unlocking before maturity forfeits a linearly shrinking share:
//   penalty = amount * (LOCK_DURATION - elapsed) / LOCK_DURATION

#ifndef STAKELEDGER_LEDGER_VESTING_H
#define STAKELEDGER_LEDGER_VESTING_H

#include <stakeledger/core/types.h>
#include <stakeledger/ledger/accrual.h>

#include <cstdint>
#include <string>

namespace stakeledger {
namespace ledger {

/// Outstanding lock for one address; amount == 0 means no lock
struct VestingLock {
    Amount amount;
    int64_t startTime{0};

    bool IsActive() const { return !amount.IsZero(); }

    /// Time at which the lock pays out in full
    int64_t MaturityTime() const { return startTime + LOCK_DURATION; }

    bool operator==(const VestingLock& other) const {
        return amount == other.amount && startTime == other.startTime;
    }

    bool operator!=(const VestingLock& other) const { return !(*this == other); }
};

/// What an unlock at a given time pays and forfeits
struct UnlockQuote {
    /// Base asset paid to the account
    Amount payout;

    /// Locked amount forfeited and burned
    Amount penalty;

    /// Seconds since the lock started (clamped at zero)
    int64_t elapsed{0};

    bool matured{false};

    std::string ToString() const;
};

/**
 * Quote an unlock of `lock` at `now`. payout + penalty always equals
 * lock.amount; the penalty is truncated, so rounding favours the account.
 * A `now` before the lock start is treated as elapsed zero.
 */
UnlockQuote ComputeUnlock(const VestingLock& lock, int64_t now);

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_VESTING_H
