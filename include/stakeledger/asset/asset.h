// StakeLedger - Asset Interfaces and Token Ledger
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// The ledger moves two fungible assets:
// - the base asset, which it only pulls into and pushes out of custody
// - the reward asset, which it additionally mints and burns as issuer
//
// AssetPort / IssuablePort are the interfaces the ledger talks to.
// TokenLedger is an in-process fungible token (balances, allowances,
// issuer-restricted supply) and TokenPort binds one to a custody address.

#ifndef STAKELEDGER_ASSET_ASSET_H
#define STAKELEDGER_ASSET_ASSET_H

#include <stakeledger/core/types.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace stakeledger {
namespace asset {

// ============================================================================
// Asset Status
// ============================================================================

enum class AssetStatus {
    Ok,
    InvalidAmount,
    InsufficientBalance,
    InsufficientAllowance,
    NotAuthorized,
    Overflow
};

const char* AssetStatusToString(AssetStatus status);

// ============================================================================
// Ports
// ============================================================================

/**
 * Custody operations on one asset, seen from the ledger.
 * Each call is atomic: on any status other than Ok nothing moved.
 */
class AssetPort {
public:
    virtual ~AssetPort() = default;

    /// Move amount from `from` into ledger custody (subject to allowance)
    virtual AssetStatus Pull(const Address& from, const Amount& amount) = 0;

    /// Move amount from ledger custody to `to`
    virtual AssetStatus Push(const Address& to, const Amount& amount) = 0;
};

/**
 * Custody plus privileged issuance. Only the ledger holds one of these
 * for the reward asset.
 */
class IssuablePort : public AssetPort {
public:
    /// Create amount and credit it to `to`
    virtual AssetStatus Mint(const Address& to, const Amount& amount) = 0;

    /// Destroy amount held by `from`
    virtual AssetStatus Burn(const Address& from, const Amount& amount) = 0;

    /// Status Burn(from, amount) would return right now, without burning
    virtual AssetStatus CheckBurn(const Address& from, const Amount& amount) const = 0;
};

// ============================================================================
// Token Ledger
// ============================================================================

/// Complete state of a TokenLedger, used for persistence
struct TokenState {
    std::string name;
    std::string symbol;
    Address issuer;
    Amount totalSupply;
    std::map<Address, Amount> balances;
    std::map<std::pair<Address, Address>, Amount> allowances;  // (owner, spender)
};

/**
 * In-process fungible token.
 *
 * Zero balances and allowances are not stored. An allowance equal to
 * Amount::Max() is never decremented.
 */
class TokenLedger {
public:
    TokenLedger(std::string name, std::string symbol, const Address& issuer);
    ~TokenLedger();

    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // === Metadata ===

    const std::string& GetName() const { return name_; }
    const std::string& GetSymbol() const { return symbol_; }
    const Address& GetIssuer() const { return issuer_; }

    // === Queries ===

    Amount BalanceOf(const Address& account) const;
    Amount Allowance(const Address& owner, const Address& spender) const;
    Amount TotalSupply() const;
    size_t HolderCount() const;

    // === Transfers ===

    /// Set the amount `spender` may move out of `owner` (replaces any previous value)
    AssetStatus Approve(const Address& owner, const Address& spender, const Amount& amount);

    AssetStatus Transfer(const Address& from, const Address& to, const Amount& amount);

    /// Move amount from `from` to `to` on behalf of `spender`
    AssetStatus TransferFrom(const Address& spender, const Address& from,
                             const Address& to, const Amount& amount);

    // === Issuance (issuer only) ===

    AssetStatus Mint(const Address& caller, const Address& to, const Amount& amount);
    AssetStatus Burn(const Address& caller, const Address& from, const Amount& amount);
    AssetStatus CheckBurn(const Address& caller, const Address& from, const Amount& amount) const;

    // === State ===

    TokenState ExportState() const;

    /// Replace balances, allowances and supply; false if the state is inconsistent
    bool ImportState(const TokenState& state);

private:
    AssetStatus TransferLocked(const Address& from, const Address& to, const Amount& amount);
    AssetStatus CheckBurnLocked(const Address& caller, const Address& from,
                                const Amount& amount) const;
    void SetBalanceLocked(const Address& account, const Amount& amount);

    mutable std::mutex mutex_;
    std::string name_;
    std::string symbol_;
    Address issuer_;
    Amount totalSupply_;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
};

// ============================================================================
// Token Port
// ============================================================================

/**
 * Binds a TokenLedger to a custody address. The custody address is also
 * the identity used for Mint and Burn, so it must be the token's issuer
 * for those to succeed.
 */
class TokenPort : public IssuablePort {
public:
    TokenPort(std::shared_ptr<TokenLedger> token, const Address& custody);

    AssetStatus Pull(const Address& from, const Amount& amount) override;
    AssetStatus Push(const Address& to, const Amount& amount) override;
    AssetStatus Mint(const Address& to, const Amount& amount) override;
    AssetStatus Burn(const Address& from, const Amount& amount) override;
    AssetStatus CheckBurn(const Address& from, const Amount& amount) const override;

    const std::shared_ptr<TokenLedger>& GetToken() const { return token_; }
    const Address& GetCustody() const { return custody_; }

    /// Amount currently held in custody
    Amount CustodyBalance() const;

private:
    std::shared_ptr<TokenLedger> token_;
    Address custody_;
};

} // namespace asset
} // namespace stakeledger

#endif // STAKELEDGER_ASSET_ASSET_H
