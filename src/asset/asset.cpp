// StakeLedger - Asset Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/asset/asset.h>
#include <stakeledger/util/logging.h>

namespace stakeledger {
namespace asset {

const char* AssetStatusToString(AssetStatus status) {
    switch (status) {
        case AssetStatus::Ok: return "Ok";
        case AssetStatus::InvalidAmount: return "InvalidAmount";
        case AssetStatus::InsufficientBalance: return "InsufficientBalance";
        case AssetStatus::InsufficientAllowance: return "InsufficientAllowance";
        case AssetStatus::NotAuthorized: return "NotAuthorized";
        case AssetStatus::Overflow: return "Overflow";
        default: return "Unknown";
    }
}

// ============================================================================
// TokenLedger
// ============================================================================

TokenLedger::TokenLedger(std::string name, std::string symbol, const Address& issuer)
    : name_(std::move(name)), symbol_(std::move(symbol)), issuer_(issuer) {}

TokenLedger::~TokenLedger() = default;

Amount TokenLedger::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : Amount();
}

Amount TokenLedger::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it != allowances_.end() ? it->second : Amount();
}

Amount TokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

size_t TokenLedger::HolderCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_.size();
}

void TokenLedger::SetBalanceLocked(const Address& account, const Amount& amount) {
    if (amount.IsZero()) {
        balances_.erase(account);
    } else {
        balances_[account] = amount;
    }
}

AssetStatus TokenLedger::Approve(const Address& owner, const Address& spender,
                                 const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount.IsZero()) {
        allowances_.erase({owner, spender});
    } else {
        allowances_[{owner, spender}] = amount;
    }
    LOG_DEBUG(util::LogCategory::ASSET) << symbol_ << " approve " << owner.ToShortString()
            << " -> " << spender.ToShortString() << " " << amount;
    return AssetStatus::Ok;
}

AssetStatus TokenLedger::TransferLocked(const Address& from, const Address& to,
                                        const Amount& amount) {
    auto it = balances_.find(from);
    Amount fromBalance = it != balances_.end() ? it->second : Amount();
    if (fromBalance < amount) {
        return AssetStatus::InsufficientBalance;
    }
    if (amount.IsZero() || from == to) {
        return AssetStatus::Ok;
    }

    auto toIt = balances_.find(to);
    Amount toBalance = toIt != balances_.end() ? toIt->second : Amount();
    Amount newTo;
    if (!CheckedAdd(toBalance, amount, newTo)) {
        return AssetStatus::Overflow;
    }

    SetBalanceLocked(from, fromBalance - amount);
    SetBalanceLocked(to, newTo);
    return AssetStatus::Ok;
}

AssetStatus TokenLedger::Transfer(const Address& from, const Address& to,
                                  const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    AssetStatus status = TransferLocked(from, to, amount);
    if (status != AssetStatus::Ok) {
        LOG_DEBUG(util::LogCategory::ASSET) << symbol_ << " transfer " << from.ToShortString() << " -> "
                << to.ToShortString() << " " << amount << " failed: "
                << AssetStatusToString(status);
    }
    return status;
}

AssetStatus TokenLedger::TransferFrom(const Address& spender, const Address& from,
                                      const Address& to, const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (spender == from) {
        return TransferLocked(from, to, amount);
    }

    auto allowIt = allowances_.find({from, spender});
    Amount allowance = allowIt != allowances_.end() ? allowIt->second : Amount();
    if (allowance < amount) {
        LOG_DEBUG(util::LogCategory::ASSET) << symbol_ << " transferFrom " << from.ToShortString()
                << " by " << spender.ToShortString() << " " << amount
                << " exceeds allowance " << allowance;
        return AssetStatus::InsufficientAllowance;
    }

    AssetStatus status = TransferLocked(from, to, amount);
    if (status != AssetStatus::Ok) {
        LOG_DEBUG(util::LogCategory::ASSET) << symbol_ << " transferFrom " << from.ToShortString()
                << " " << amount << " failed: " << AssetStatusToString(status);
        return status;
    }

    if (allowance != Amount::Max() && !amount.IsZero()) {
        Amount remaining = allowance - amount;
        if (remaining.IsZero()) {
            allowances_.erase(allowIt);
        } else {
            allowIt->second = remaining;
        }
    }
    return AssetStatus::Ok;
}

AssetStatus TokenLedger::Mint(const Address& caller, const Address& to, const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != issuer_) {
        LOG_WARN(util::LogCategory::ASSET) << symbol_ << " mint by non-issuer " << caller.ToShortString();
        return AssetStatus::NotAuthorized;
    }
    if (amount.IsZero()) {
        return AssetStatus::InvalidAmount;
    }

    auto it = balances_.find(to);
    Amount balance = it != balances_.end() ? it->second : Amount();
    Amount newSupply;
    Amount newBalance;
    if (!CheckedAdd(totalSupply_, amount, newSupply) ||
        !CheckedAdd(balance, amount, newBalance)) {
        return AssetStatus::Overflow;
    }

    totalSupply_ = newSupply;
    SetBalanceLocked(to, newBalance);
    LOG_DEBUG(util::LogCategory::ASSET) << symbol_ << " mint " << amount << " to " << to.ToShortString();
    return AssetStatus::Ok;
}

AssetStatus TokenLedger::CheckBurnLocked(const Address& caller, const Address& from,
                                         const Amount& amount) const {
    if (caller != issuer_) {
        return AssetStatus::NotAuthorized;
    }
    if (amount.IsZero()) {
        return AssetStatus::InvalidAmount;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return AssetStatus::InsufficientBalance;
    }
    return AssetStatus::Ok;
}

AssetStatus TokenLedger::CheckBurn(const Address& caller, const Address& from,
                                   const Amount& amount) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CheckBurnLocked(caller, from, amount);
}

AssetStatus TokenLedger::Burn(const Address& caller, const Address& from, const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    AssetStatus status = CheckBurnLocked(caller, from, amount);
    if (status != AssetStatus::Ok) {
        if (status == AssetStatus::NotAuthorized) {
            LOG_WARN(util::LogCategory::ASSET) << symbol_ << " burn by non-issuer "
                << caller.ToShortString();
        }
        return status;
    }

    SetBalanceLocked(from, balances_[from] - amount);
    totalSupply_ -= amount;
    LOG_DEBUG(util::LogCategory::ASSET) << symbol_ << " burn " << amount << " from " << from.ToShortString();
    return AssetStatus::Ok;
}

TokenState TokenLedger::ExportState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TokenState state;
    state.name = name_;
    state.symbol = symbol_;
    state.issuer = issuer_;
    state.totalSupply = totalSupply_;
    state.balances = balances_;
    state.allowances = allowances_;
    return state;
}

bool TokenLedger::ImportState(const TokenState& state) {
    Amount sum;
    for (const auto& [account, balance] : state.balances) {
        if (!CheckedAdd(sum, balance, sum)) {
            return false;
        }
    }
    if (sum != state.totalSupply) {
        LOG_ERROR(util::LogCategory::ASSET) << state.symbol << " state rejected: balances sum to " << sum
                << ", supply is " << state.totalSupply;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    name_ = state.name;
    symbol_ = state.symbol;
    issuer_ = state.issuer;
    totalSupply_ = state.totalSupply;
    balances_.clear();
    for (const auto& [account, balance] : state.balances) {
        SetBalanceLocked(account, balance);
    }
    allowances_.clear();
    for (const auto& [key, allowance] : state.allowances) {
        if (!allowance.IsZero()) {
            allowances_[key] = allowance;
        }
    }
    return true;
}

// ============================================================================
// TokenPort
// ============================================================================

TokenPort::TokenPort(std::shared_ptr<TokenLedger> token, const Address& custody)
    : token_(std::move(token)), custody_(custody) {}

AssetStatus TokenPort::Pull(const Address& from, const Amount& amount) {
    return token_->TransferFrom(custody_, from, custody_, amount);
}

AssetStatus TokenPort::Push(const Address& to, const Amount& amount) {
    return token_->Transfer(custody_, to, amount);
}

AssetStatus TokenPort::Mint(const Address& to, const Amount& amount) {
    return token_->Mint(custody_, to, amount);
}

AssetStatus TokenPort::Burn(const Address& from, const Amount& amount) {
    return token_->Burn(custody_, from, amount);
}

AssetStatus TokenPort::CheckBurn(const Address& from, const Amount& amount) const {
    return token_->CheckBurn(custody_, from, amount);
}

Amount TokenPort::CustodyBalance() const {
    return token_->BalanceOf(custody_);
}

} // namespace asset
} // namespace stakeledger
