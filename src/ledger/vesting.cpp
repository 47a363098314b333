// StakeLedger - Vesting Locks Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/ledger/vesting.h>

#include <sstream>
#include <stdexcept>

namespace stakeledger {
namespace ledger {

std::string UnlockQuote::ToString() const {
    std::ostringstream oss;
    oss << "UnlockQuote(payout=" << FormatUnits(payout, TOKEN_DECIMALS)
        << ", penalty=" << FormatUnits(penalty, TOKEN_DECIMALS)
        << ", elapsed=" << util::FormatDuration(util::Seconds{elapsed})
        << (matured ? ", matured" : "") << ")";
    return oss.str();
}

UnlockQuote ComputeUnlock(const VestingLock& lock, int64_t now) {
    UnlockQuote quote;
    quote.elapsed = now > lock.startTime ? now - lock.startTime : 0;

    if (quote.elapsed >= LOCK_DURATION) {
        quote.matured = true;
        quote.payout = lock.amount;
        return quote;
    }

    // remaining < LOCK_DURATION, so the quotient never exceeds lock.amount
    Amount remaining(static_cast<uint64_t>(LOCK_DURATION - quote.elapsed));
    if (!MulDiv(lock.amount, remaining, Amount(static_cast<uint64_t>(LOCK_DURATION)),
                quote.penalty)) {
        throw std::overflow_error("ComputeUnlock: penalty out of range");
    }
    quote.payout = lock.amount - quote.penalty;
    return quote;
}

} // namespace ledger
} // namespace stakeledger
