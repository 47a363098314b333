// StakeLedger - Staking Ledger Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/ledger/ledger.h>
#include <stakeledger/util/logging.h>
#include <stakeledger/util/time.h>

#include <sstream>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Enum Strings
// ============================================================================

const char* LedgerErrorToString(LedgerError error) {
    switch (error) {
        case LedgerError::OK: return "OK";
        case LedgerError::InvalidAmount: return "InvalidAmount";
        case LedgerError::InsufficientStake: return "InsufficientStake";
        case LedgerError::InsufficientReserve: return "InsufficientReserve";
        case LedgerError::InsufficientAssetBalance: return "InsufficientAssetBalance";
        case LedgerError::NoReward: return "NoReward";
        case LedgerError::NoLockActive: return "NoLockActive";
        case LedgerError::LockAlreadyActive: return "LockAlreadyActive";
        case LedgerError::NotAuthorized: return "NotAuthorized";
        case LedgerError::ReentrantCall: return "ReentrantCall";
        case LedgerError::ArithmeticOverflow: return "ArithmeticOverflow";
        default: return "Unknown";
    }
}

LedgerError FromAssetStatus(asset::AssetStatus status) {
    switch (status) {
        case asset::AssetStatus::Ok: return LedgerError::OK;
        case asset::AssetStatus::InvalidAmount: return LedgerError::InvalidAmount;
        case asset::AssetStatus::InsufficientBalance:
        case asset::AssetStatus::InsufficientAllowance:
            return LedgerError::InsufficientAssetBalance;
        case asset::AssetStatus::NotAuthorized: return LedgerError::NotAuthorized;
        case asset::AssetStatus::Overflow: return LedgerError::ArithmeticOverflow;
        default: return LedgerError::InsufficientAssetBalance;
    }
}

const char* LedgerEventTypeToString(LedgerEventType type) {
    switch (type) {
        case LedgerEventType::Staked: return "Staked";
        case LedgerEventType::Unstaked: return "Unstaked";
        case LedgerEventType::RewardClaimed: return "RewardClaimed";
        case LedgerEventType::TokenLocked: return "TokenLocked";
        case LedgerEventType::TokenUnlocked: return "TokenUnlocked";
        case LedgerEventType::ReserveDeposited: return "ReserveDeposited";
        default: return "Unknown";
    }
}

std::string LedgerEvent::ToString() const {
    std::ostringstream oss;
    oss << LedgerEventTypeToString(type) << "(";
    if (type != LedgerEventType::ReserveDeposited) {
        oss << account.ToShortString() << ", ";
    }
    oss << FormatUnits(amount, TOKEN_DECIMALS);
    if (type == LedgerEventType::TokenUnlocked) {
        oss << ", penalty=" << FormatUnits(penalty, TOKEN_DECIMALS);
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// Reentrancy Guard
// ============================================================================

/**
 * Holds the ledger lock for one mutating operation and marks it in flight.
 * A nested mutating call on the same thread takes the (recursive) lock but
 * finds the flag set and must bail out with ReentrantCall.
 */
class StakeLedger::ReentrancyGuard {
public:
    explicit ReentrancyGuard(StakeLedger& ledger)
        : lock_(ledger.mutex_), entered_(ledger.entered_), acquired_(!ledger.entered_) {
        if (acquired_) {
            entered_ = true;
        }
    }

    ~ReentrancyGuard() {
        if (acquired_) {
            entered_ = false;
        }
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool Acquired() const { return acquired_; }

private:
    std::unique_lock<std::recursive_mutex> lock_;
    bool& entered_;
    bool acquired_;
};

// ============================================================================
// StakeLedger
// ============================================================================

StakeLedger::StakeLedger(const Address& self,
                         const Address& administrator,
                         std::shared_ptr<asset::AssetPort> baseAsset,
                         std::shared_ptr<asset::IssuablePort> rewardAsset)
    : self_(self)
    , administrator_(administrator)
    , base_(std::move(baseAsset))
    , reward_(std::move(rewardAsset))
    , reserve_(administrator) {}

StakeLedger::~StakeLedger() = default;

StakeAccount StakeLedger::LoadAccount(const Address& account) const {
    auto it = accounts_.find(account);
    return it != accounts_.end() ? it->second : StakeAccount{};
}

void StakeLedger::Emit(const LedgerEvent& event) {
    LOG_INFO(util::LogCategory::LEDGER) << event.ToString();
    if (eventCallback_) {
        eventCallback_(event);
    }
}

void StakeLedger::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

// ============================================================================
// Mutating Operations
// ============================================================================

LedgerError StakeLedger::Stake(const Address& caller, const Amount& amount) {
    ReentrancyGuard guard(*this);
    if (!guard.Acquired()) {
        LOG_WARN(util::LogCategory::LEDGER) << "Reentrant stake by " << caller.ToShortString();
        return LedgerError::ReentrantCall;
    }
    if (amount.IsZero()) {
        return LedgerError::InvalidAmount;
    }

    int64_t now = util::GetTime();
    StakeAccount account = LoadAccount(caller);
    Amount newTotal;
    if (!Checkpoint(account, now) ||
        !CheckedAdd(account.stakedAmount, amount, account.stakedAmount) ||
        !CheckedAdd(totalStaked_, amount, newTotal)) {
        return LedgerError::ArithmeticOverflow;
    }

    asset::AssetStatus status = base_->Pull(caller, amount);
    if (status != asset::AssetStatus::Ok) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Stake by " << caller.ToShortString()
            << " failed: base pull " << asset::AssetStatusToString(status);
        return FromAssetStatus(status);
    }

    accounts_[caller] = account;
    totalStaked_ = newTotal;

    Emit({LedgerEventType::Staked, caller, amount, Amount(), now});
    return LedgerError::OK;
}

LedgerError StakeLedger::Unstake(const Address& caller, const Amount& amount) {
    ReentrancyGuard guard(*this);
    if (!guard.Acquired()) {
        LOG_WARN(util::LogCategory::LEDGER) << "Reentrant unstake by " << caller.ToShortString();
        return LedgerError::ReentrantCall;
    }
    if (amount.IsZero()) {
        return LedgerError::InvalidAmount;
    }

    StakeAccount account = LoadAccount(caller);
    if (amount > account.stakedAmount) {
        return LedgerError::InsufficientStake;
    }

    int64_t now = util::GetTime();
    Amount newTotal;
    if (!Checkpoint(account, now) ||
        !CheckedSub(totalStaked_, amount, newTotal)) {
        return LedgerError::ArithmeticOverflow;
    }
    account.stakedAmount -= amount;

    asset::AssetStatus status = base_->Push(caller, amount);
    if (status != asset::AssetStatus::Ok) {
        LOG_WARN(util::LogCategory::LEDGER) << "Unstake by " << caller.ToShortString()
            << " failed: base push " << asset::AssetStatusToString(status);
        return FromAssetStatus(status);
    }

    accounts_[caller] = account;
    totalStaked_ = newTotal;

    Emit({LedgerEventType::Unstaked, caller, amount, Amount(), now});
    return LedgerError::OK;
}

LedgerError StakeLedger::ClaimReward(const Address& caller, Amount* claimed) {
    ReentrancyGuard guard(*this);
    if (!guard.Acquired()) {
        LOG_WARN(util::LogCategory::LEDGER) << "Reentrant claim by " << caller.ToShortString();
        return LedgerError::ReentrantCall;
    }

    int64_t now = util::GetTime();
    StakeAccount account = LoadAccount(caller);
    if (!Checkpoint(account, now)) {
        return LedgerError::ArithmeticOverflow;
    }
    if (account.unclaimedRewards.IsZero()) {
        return LedgerError::NoReward;
    }

    Amount reward = account.unclaimedRewards;
    Amount newMinted;
    if (!CheckedAdd(totalMinted_, reward, newMinted)) {
        return LedgerError::ArithmeticOverflow;
    }
    account.unclaimedRewards = Amount();

    asset::AssetStatus status = reward_->Mint(caller, reward);
    if (status != asset::AssetStatus::Ok) {
        LOG_WARN(util::LogCategory::LEDGER) << "Claim by " << caller.ToShortString()
            << " failed: reward mint " << asset::AssetStatusToString(status);
        return FromAssetStatus(status);
    }

    accounts_[caller] = account;
    totalMinted_ = newMinted;
    if (claimed) {
        *claimed = reward;
    }

    Emit({LedgerEventType::RewardClaimed, caller, reward, Amount(), now});
    return LedgerError::OK;
}

LedgerError StakeLedger::LockTokens(const Address& caller, const Amount& amount) {
    ReentrancyGuard guard(*this);
    if (!guard.Acquired()) {
        LOG_WARN(util::LogCategory::LEDGER) << "Reentrant lock by " << caller.ToShortString();
        return LedgerError::ReentrantCall;
    }
    if (amount.IsZero()) {
        return LedgerError::InvalidAmount;
    }

    auto it = locks_.find(caller);
    if (it != locks_.end() && it->second.IsActive()) {
        return LedgerError::LockAlreadyActive;
    }

    // No accrual checkpoint: locking moves the reward asset only
    int64_t now = util::GetTime();
    asset::AssetStatus status = reward_->Pull(caller, amount);
    if (status != asset::AssetStatus::Ok) {
        LOG_DEBUG(util::LogCategory::VESTING) << "Lock by " << caller.ToShortString()
            << " failed: reward pull " << asset::AssetStatusToString(status);
        return FromAssetStatus(status);
    }

    locks_[caller] = VestingLock{amount, now};
    LOG_DEBUG(util::LogCategory::VESTING) << "Lock for " << caller.ToShortString()
        << " matures at " << util::FormatISO8601(util::FromUnixTime(now + LOCK_DURATION));

    Emit({LedgerEventType::TokenLocked, caller, amount, Amount(), now});
    return LedgerError::OK;
}

LedgerError StakeLedger::UnlockTokens(const Address& caller, UnlockQuote* result) {
    ReentrancyGuard guard(*this);
    if (!guard.Acquired()) {
        LOG_WARN(util::LogCategory::LEDGER) << "Reentrant unlock by " << caller.ToShortString();
        return LedgerError::ReentrantCall;
    }

    auto it = locks_.find(caller);
    if (it == locks_.end() || !it->second.IsActive()) {
        return LedgerError::NoLockActive;
    }

    int64_t now = util::GetTime();
    StakeAccount account = LoadAccount(caller);
    if (!Checkpoint(account, now)) {
        return LedgerError::ArithmeticOverflow;
    }

    UnlockQuote quote = ComputeUnlock(it->second, now);

    ReserveManager reserve = reserve_;
    if (!reserve.Debit(quote.payout)) {
        LOG_WARN(util::LogCategory::RESERVE) << "Unlock by " << caller.ToShortString()
            << " needs " << FormatUnits(quote.payout, TOKEN_DECIMALS)
            << ", reserve holds " << FormatUnits(reserve_.GetReserve(), TOKEN_DECIMALS);
        return LedgerError::InsufficientReserve;
    }

    Amount newBurned;
    if (!CheckedAdd(totalBurned_, quote.penalty, newBurned)) {
        return LedgerError::ArithmeticOverflow;
    }

    // The burn runs last, so everything that could stop it is checked first
    if (!quote.penalty.IsZero()) {
        asset::AssetStatus status = reward_->CheckBurn(self_, quote.penalty);
        if (status != asset::AssetStatus::Ok) {
            LOG_WARN(util::LogCategory::VESTING) << "Unlock by " << caller.ToShortString()
                << " failed: penalty burn " << asset::AssetStatusToString(status);
            return FromAssetStatus(status);
        }
    }

    if (!quote.payout.IsZero()) {
        asset::AssetStatus status = base_->Push(caller, quote.payout);
        if (status != asset::AssetStatus::Ok) {
            LOG_WARN(util::LogCategory::VESTING) << "Unlock by " << caller.ToShortString()
                << " failed: base push " << asset::AssetStatusToString(status);
            return FromAssetStatus(status);
        }
    }

    if (!quote.penalty.IsZero()) {
        asset::AssetStatus status = reward_->Burn(self_, quote.penalty);
        if (status != asset::AssetStatus::Ok) {
            // Payout already delivered; the penalty stays in custody unburned
            LOG_ERROR(util::LogCategory::VESTING) << "Penalty burn of "
                << FormatUnits(quote.penalty, TOKEN_DECIMALS) << " for " << caller.ToShortString()
                << " failed after payout: " << asset::AssetStatusToString(status);
            newBurned = totalBurned_;
        }
    }

    accounts_[caller] = account;
    locks_.erase(it);
    reserve_ = reserve;
    totalBurned_ = newBurned;
    if (result) {
        *result = quote;
    }

    Emit({LedgerEventType::TokenUnlocked, caller, quote.payout, quote.penalty, now});
    return LedgerError::OK;
}

LedgerError StakeLedger::DepositReserve(const Address& caller, const Amount& amount) {
    ReentrancyGuard guard(*this);
    if (!guard.Acquired()) {
        LOG_WARN(util::LogCategory::LEDGER) << "Reentrant deposit by " << caller.ToShortString();
        return LedgerError::ReentrantCall;
    }
    if (amount.IsZero()) {
        return LedgerError::InvalidAmount;
    }
    if (!reserve_.IsAdministrator(caller)) {
        LOG_WARN(util::LogCategory::RESERVE) << "Deposit by non-administrator "
            << caller.ToShortString();
        return LedgerError::NotAuthorized;
    }

    int64_t now = util::GetTime();
    StakeAccount account = LoadAccount(caller);
    ReserveManager reserve = reserve_;
    if (!Checkpoint(account, now) || !reserve.Credit(amount)) {
        return LedgerError::ArithmeticOverflow;
    }

    asset::AssetStatus status = base_->Pull(caller, amount);
    if (status != asset::AssetStatus::Ok) {
        LOG_DEBUG(util::LogCategory::RESERVE) << "Deposit failed: base pull "
            << asset::AssetStatusToString(status);
        return FromAssetStatus(status);
    }

    accounts_[caller] = account;
    reserve_ = reserve;

    Emit({LedgerEventType::ReserveDeposited, caller, amount, Amount(), now});
    return LedgerError::OK;
}

// ============================================================================
// Queries
// ============================================================================

Amount StakeLedger::PendingReward(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return ledger::PendingReward(LoadAccount(account), util::GetTime());
}

Amount StakeLedger::GetUserShare(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (totalStaked_.IsZero()) {
        return Amount();
    }
    Amount share;
    if (!MulDiv(LoadAccount(account).stakedAmount, REWARD_RATE, totalStaked_, share)) {
        return Amount::Max();
    }
    return share;
}

std::optional<UnlockQuote> StakeLedger::PreviewUnlock(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = locks_.find(account);
    if (it == locks_.end() || !it->second.IsActive()) {
        return std::nullopt;
    }
    return ComputeUnlock(it->second, util::GetTime());
}

StakeAccount StakeLedger::GetAccount(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return LoadAccount(account);
}

VestingLock StakeLedger::GetLock(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = locks_.find(account);
    return it != locks_.end() ? it->second : VestingLock{};
}

Amount StakeLedger::GetTotalStaked() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return totalStaked_;
}

Amount StakeLedger::GetReserve() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return reserve_.GetReserve();
}

size_t StakeLedger::GetAccountCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return accounts_.size();
}

size_t StakeLedger::GetActiveLockCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return locks_.size();
}

Amount StakeLedger::GetTotalDeposited() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return reserve_.GetTotalDeposited();
}

Amount StakeLedger::GetTotalPaidOut() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return reserve_.GetTotalPaidOut();
}

Amount StakeLedger::GetTotalBurned() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return totalBurned_;
}

Amount StakeLedger::GetTotalMinted() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return totalMinted_;
}

// ============================================================================
// State
// ============================================================================

LedgerState StakeLedger::ExportState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    LedgerState state;
    state.accounts = accounts_;
    state.locks = locks_;
    state.totalStaked = totalStaked_;
    state.reserve = reserve_.GetReserve();
    state.totalDeposited = reserve_.GetTotalDeposited();
    state.totalPaidOut = reserve_.GetTotalPaidOut();
    state.totalBurned = totalBurned_;
    state.totalMinted = totalMinted_;
    return state;
}

bool StakeLedger::ImportState(const LedgerState& state) {
    ReentrancyGuard guard(*this);
    if (!guard.Acquired()) {
        return false;
    }

    Amount staked;
    for (const auto& [address, account] : state.accounts) {
        if (!CheckedAdd(staked, account.stakedAmount, staked)) {
            LOG_ERROR(util::LogCategory::LEDGER) << "Imported stakes overflow";
            return false;
        }
    }
    if (staked != state.totalStaked) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Imported totalStaked " << state.totalStaked
            << " does not match account stakes " << staked;
        return false;
    }

    accounts_ = state.accounts;
    locks_.clear();
    for (const auto& [address, lock] : state.locks) {
        if (lock.IsActive()) {
            locks_[address] = lock;
        }
    }
    totalStaked_ = state.totalStaked;
    reserve_.Restore(state.reserve, state.totalDeposited, state.totalPaidOut);
    totalBurned_ = state.totalBurned;
    totalMinted_ = state.totalMinted;

    LOG_INFO(util::LogCategory::LEDGER) << "Loaded " << accounts_.size() << " accounts, "
        << locks_.size() << " locks, totalStaked "
        << FormatUnits(totalStaked_, TOKEN_DECIMALS);
    return true;
}

} // namespace ledger
} // namespace stakeledger
