// StakeLedger - Reward Accrual Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/ledger/accrual.h>
#include <stakeledger/util/logging.h>

#include <sstream>

namespace stakeledger {
namespace ledger {

namespace {

const Amount& AccrualDenominator() {
    static const Amount denom = Amount(static_cast<uint64_t>(SECONDS_PER_DAY)) * FIXED_POINT_SCALE;
    return denom;
}

} // namespace

std::string StakeAccount::ToString() const {
    std::ostringstream oss;
    oss << "StakeAccount(staked=" << FormatUnits(stakedAmount, TOKEN_DECIMALS)
        << ", unclaimed=" << FormatUnits(unclaimedRewards, TOKEN_DECIMALS)
        << ", lastUpdate=" << lastUpdateTime << ")";
    return oss.str();
}

bool ComputeAccrual(const Amount& staked, int64_t elapsed, Amount& accrued) {
    if (elapsed <= 0 || staked.IsZero()) {
        accrued = Amount();
        return true;
    }

    // elapsed * REWARD_RATE is below 2^127, so only the final quotient can overflow
    Amount rateTime = Amount(static_cast<uint64_t>(elapsed)) * REWARD_RATE;
    return MulDiv(staked, rateTime, AccrualDenominator(), accrued);
}

bool Checkpoint(StakeAccount& account, int64_t now) {
    if (now <= account.lastUpdateTime) {
        if (now < account.lastUpdateTime) {
            LOG_DEBUG(util::LogCategory::ACCRUAL) << "Clock behind checkpoint by "
                << (account.lastUpdateTime - now) << "s, nothing accrued";
        }
        return true;
    }

    Amount unclaimed = account.unclaimedRewards;
    if (!account.stakedAmount.IsZero()) {
        Amount accrued;
        if (!ComputeAccrual(account.stakedAmount, now - account.lastUpdateTime, accrued) ||
            !CheckedAdd(unclaimed, accrued, unclaimed)) {
            LOG_WARN(util::LogCategory::ACCRUAL) << "Accrual overflow for stake "
                                                  << account.stakedAmount;
            return false;
        }
    }

    account.unclaimedRewards = unclaimed;
    account.lastUpdateTime = now;
    return true;
}

Amount PendingReward(const StakeAccount& account, int64_t now) {
    Amount accrued;
    if (!ComputeAccrual(account.stakedAmount, now - account.lastUpdateTime, accrued)) {
        return Amount::Max();
    }
    Amount total;
    if (!CheckedAdd(account.unclaimedRewards, accrued, total)) {
        return Amount::Max();
    }
    return total;
}

} // namespace ledger
} // namespace stakeledger
