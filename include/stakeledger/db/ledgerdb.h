// StakeLedger - Ledger Database
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Persists a StakeLedger and the token ledgers it moves, as one atomic
// snapshot.
//
// Layout:
//   'S'                          -> version, totalStaked, reserve, lifetime counters
//   'a' + address                -> stake account
//   'v' + address                -> vesting lock
//   'T' + symbol                 -> token name, issuer, total supply
//   'b' + symbol + address       -> token balance
//   'l' + symbol + owner+spender -> token allowance
// Symbols inside keys are length-prefixed so no symbol is a prefix of another.

#ifndef STAKELEDGER_DB_LEDGERDB_H
#define STAKELEDGER_DB_LEDGERDB_H

#include <stakeledger/asset/asset.h>
#include <stakeledger/db/database.h>
#include <stakeledger/ledger/ledger.h>

#include <memory>
#include <string>
#include <vector>

namespace stakeledger {
namespace db {

/// On-disk format version
constexpr uint8_t LEDGER_DB_VERSION = 1;

class LedgerDB {
public:
    explicit LedgerDB(std::unique_ptr<Database> db);
    ~LedgerDB();

    LedgerDB(const LedgerDB&) = delete;
    LedgerDB& operator=(const LedgerDB&) = delete;

    /// True once a snapshot has been written
    bool HasSnapshot();

    // === Raw State ===

    /**
     * Replace the stored ledger and the given tokens with a new snapshot.
     * Everything is written in a single batch. Tokens not listed keep
     * their stored records.
     */
    Status WriteSnapshot(const ledger::LedgerState& state,
                         const std::vector<asset::TokenState>& tokens,
                         bool sync = true);

    /// NotFound if no snapshot exists, Corruption if a record fails to decode
    Status ReadLedgerState(ledger::LedgerState& state);

    /// NotFound if the token was never written
    Status ReadTokenState(const std::string& symbol, asset::TokenState& state);

    // === Live Objects ===

    /// Snapshot a ledger and its tokens
    Status Save(const ledger::StakeLedger& ledger,
                const std::vector<const asset::TokenLedger*>& tokens);

    /**
     * Load the stored snapshot into a ledger and its tokens (matched by
     * symbol). Corruption if the stored totalStaked disagrees with the
     * account stakes or a token's balances disagree with its supply; in
     * that case nothing is imported.
     */
    Status Load(ledger::StakeLedger& ledger,
                const std::vector<asset::TokenLedger*>& tokens);

    Database& GetDatabase() { return *db_; }

private:
    Status DeletePrefix(const std::string& prefix, WriteBatch& batch);

    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace stakeledger

#endif // STAKELEDGER_DB_LEDGERDB_H
