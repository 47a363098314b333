// StakeLedger - Ledger Database Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/db/ledgerdb.h>
#include <stakeledger/util/logging.h>

#include <ios>

namespace stakeledger {
namespace db {

namespace {

std::string SymbolKey(char prefix, const std::string& symbol) {
    DataStream s;
    WriteString(s, symbol);
    return MakeKey(prefix, s.str());
}

std::string AddressBytes(const Address& address) {
    return std::string(reinterpret_cast<const char*>(address.data()), address.size());
}

Address AddressAt(const Slice& key, size_t offset) {
    return Address(reinterpret_cast<const Byte*>(key.data() + offset), Address::SIZE);
}

// === Record encoding ===

std::string EncodeAccount(const ledger::StakeAccount& account) {
    DataStream s;
    WriteAmount(s, account.stakedAmount);
    WriteAmount(s, account.unclaimedRewards);
    WriteI64(s, account.lastUpdateTime);
    return s.str();
}

ledger::StakeAccount DecodeAccount(const Slice& value) {
    DataStream s(reinterpret_cast<const uint8_t*>(value.data()), value.size());
    ledger::StakeAccount account;
    account.stakedAmount = ReadAmount(s);
    account.unclaimedRewards = ReadAmount(s);
    account.lastUpdateTime = ReadI64(s);
    return account;
}

std::string EncodeLock(const ledger::VestingLock& lock) {
    DataStream s;
    WriteAmount(s, lock.amount);
    WriteI64(s, lock.startTime);
    return s.str();
}

ledger::VestingLock DecodeLock(const Slice& value) {
    DataStream s(reinterpret_cast<const uint8_t*>(value.data()), value.size());
    ledger::VestingLock lock;
    lock.amount = ReadAmount(s);
    lock.startTime = ReadI64(s);
    return lock;
}

std::string EncodeAmount(const Amount& amount) {
    DataStream s;
    WriteAmount(s, amount);
    return s.str();
}

Amount DecodeAmount(const Slice& value) {
    DataStream s(reinterpret_cast<const uint8_t*>(value.data()), value.size());
    return ReadAmount(s);
}

bool StakesMatchTotal(const ledger::LedgerState& state) {
    Amount sum;
    for (const auto& [address, account] : state.accounts) {
        if (!CheckedAdd(sum, account.stakedAmount, sum)) {
            return false;
        }
    }
    return sum == state.totalStaked;
}

bool BalancesMatchSupply(const asset::TokenState& state) {
    Amount sum;
    for (const auto& [address, balance] : state.balances) {
        if (!CheckedAdd(sum, balance, sum)) {
            return false;
        }
    }
    return sum == state.totalSupply;
}

} // namespace

LedgerDB::LedgerDB(std::unique_ptr<Database> db) : db_(std::move(db)) {}

LedgerDB::~LedgerDB() = default;

bool LedgerDB::HasSnapshot() {
    return db_->Exists(MakeKey(prefix::LEDGER_STATE));
}

Status LedgerDB::DeletePrefix(const std::string& keyPrefix, WriteBatch& batch) {
    auto it = db_->NewIterator();
    for (it->Seek(keyPrefix); it->Valid() && it->key().starts_with(keyPrefix); it->Next()) {
        batch.Delete(it->key());
    }
    return it->status();
}

// ============================================================================
// Raw State
// ============================================================================

Status LedgerDB::WriteSnapshot(const ledger::LedgerState& state,
                               const std::vector<asset::TokenState>& tokens,
                               bool sync) {
    WriteBatch batch;

    // Drop stale records first; later Puts in the same batch win
    for (const std::string& stale : {MakeKey(prefix::ACCOUNT), MakeKey(prefix::LOCK)}) {
        Status s = DeletePrefix(stale, batch);
        if (!s.ok()) {
            return s;
        }
    }
    for (const auto& token : tokens) {
        for (char p : {prefix::BALANCE, prefix::ALLOWANCE}) {
            Status s = DeletePrefix(SymbolKey(p, token.symbol), batch);
            if (!s.ok()) {
                return s;
            }
        }
    }

    DataStream header;
    WriteU8(header, LEDGER_DB_VERSION);
    WriteAmount(header, state.totalStaked);
    WriteAmount(header, state.reserve);
    WriteAmount(header, state.totalDeposited);
    WriteAmount(header, state.totalPaidOut);
    WriteAmount(header, state.totalBurned);
    WriteAmount(header, state.totalMinted);
    batch.Put(MakeKey(prefix::LEDGER_STATE), header.str());

    for (const auto& [address, account] : state.accounts) {
        batch.Put(MakeKey(prefix::ACCOUNT, address), EncodeAccount(account));
    }
    for (const auto& [address, lock] : state.locks) {
        if (lock.IsActive()) {
            batch.Put(MakeKey(prefix::LOCK, address), EncodeLock(lock));
        }
    }

    for (const auto& token : tokens) {
        DataStream tokenHeader;
        WriteString(tokenHeader, token.name);
        WriteAddress(tokenHeader, token.issuer);
        WriteAmount(tokenHeader, token.totalSupply);
        batch.Put(SymbolKey(prefix::TOKEN, token.symbol), tokenHeader.str());

        std::string balancePrefix = SymbolKey(prefix::BALANCE, token.symbol);
        for (const auto& [address, balance] : token.balances) {
            batch.Put(balancePrefix + AddressBytes(address), EncodeAmount(balance));
        }
        std::string allowancePrefix = SymbolKey(prefix::ALLOWANCE, token.symbol);
        for (const auto& [key, allowance] : token.allowances) {
            batch.Put(allowancePrefix + AddressBytes(key.first) + AddressBytes(key.second),
                      EncodeAmount(allowance));
        }
    }

    WriteOptions options;
    options.sync = sync;
    Status s = db_->Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Snapshot write failed: " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Wrote snapshot: " << state.accounts.size()
        << " accounts, " << state.locks.size() << " locks, " << tokens.size()
        << " tokens (" << batch.ApproximateSize() << " bytes)";
    return Status::Ok();
}

Status LedgerDB::ReadLedgerState(ledger::LedgerState& state) {
    std::string value;
    Status s = db_->Get(MakeKey(prefix::LEDGER_STATE), &value);
    if (!s.ok()) {
        return s;
    }

    ledger::LedgerState result;
    try {
        DataStream header(value);
        uint8_t version = ReadU8(header);
        if (version != LEDGER_DB_VERSION) {
            return Status::NotSupported("ledger format version " + std::to_string(version));
        }
        result.totalStaked = ReadAmount(header);
        result.reserve = ReadAmount(header);
        result.totalDeposited = ReadAmount(header);
        result.totalPaidOut = ReadAmount(header);
        result.totalBurned = ReadAmount(header);
        result.totalMinted = ReadAmount(header);

        const size_t keySize = 1 + Address::SIZE;

        std::string accountPrefix = MakeKey(prefix::ACCOUNT);
        auto it = db_->NewIterator();
        for (it->Seek(accountPrefix); it->Valid() && it->key().starts_with(accountPrefix);
             it->Next()) {
            if (it->key().size() != keySize) {
                return Status::Corruption("malformed account key");
            }
            result.accounts[AddressAt(it->key(), 1)] = DecodeAccount(it->value());
        }
        if (!it->status().ok()) {
            return it->status();
        }

        std::string lockPrefix = MakeKey(prefix::LOCK);
        it = db_->NewIterator();
        for (it->Seek(lockPrefix); it->Valid() && it->key().starts_with(lockPrefix);
             it->Next()) {
            if (it->key().size() != keySize) {
                return Status::Corruption("malformed lock key");
            }
            result.locks[AddressAt(it->key(), 1)] = DecodeLock(it->value());
        }
        if (!it->status().ok()) {
            return it->status();
        }
    } catch (const std::ios_base::failure& e) {
        return Status::Corruption(std::string("ledger record: ") + e.what());
    }

    state = std::move(result);
    return Status::Ok();
}

Status LedgerDB::ReadTokenState(const std::string& symbol, asset::TokenState& state) {
    std::string value;
    Status s = db_->Get(SymbolKey(prefix::TOKEN, symbol), &value);
    if (!s.ok()) {
        return s;
    }

    asset::TokenState result;
    result.symbol = symbol;
    try {
        DataStream header(value);
        result.name = ReadString(header);
        result.issuer = ReadAddress(header);
        result.totalSupply = ReadAmount(header);

        std::string balancePrefix = SymbolKey(prefix::BALANCE, symbol);
        auto it = db_->NewIterator();
        for (it->Seek(balancePrefix); it->Valid() && it->key().starts_with(balancePrefix);
             it->Next()) {
            if (it->key().size() != balancePrefix.size() + Address::SIZE) {
                return Status::Corruption("malformed balance key");
            }
            result.balances[AddressAt(it->key(), balancePrefix.size())] =
                DecodeAmount(it->value());
        }
        if (!it->status().ok()) {
            return it->status();
        }

        std::string allowancePrefix = SymbolKey(prefix::ALLOWANCE, symbol);
        it = db_->NewIterator();
        for (it->Seek(allowancePrefix); it->Valid() && it->key().starts_with(allowancePrefix);
             it->Next()) {
            if (it->key().size() != allowancePrefix.size() + 2 * Address::SIZE) {
                return Status::Corruption("malformed allowance key");
            }
            Address owner = AddressAt(it->key(), allowancePrefix.size());
            Address spender = AddressAt(it->key(), allowancePrefix.size() + Address::SIZE);
            result.allowances[{owner, spender}] = DecodeAmount(it->value());
        }
        if (!it->status().ok()) {
            return it->status();
        }
    } catch (const std::ios_base::failure& e) {
        return Status::Corruption("token " + symbol + ": " + e.what());
    }

    state = std::move(result);
    return Status::Ok();
}

// ============================================================================
// Live Objects
// ============================================================================

Status LedgerDB::Save(const ledger::StakeLedger& ledger,
                      const std::vector<const asset::TokenLedger*>& tokens) {
    std::vector<asset::TokenState> tokenStates;
    tokenStates.reserve(tokens.size());
    for (const auto* token : tokens) {
        tokenStates.push_back(token->ExportState());
    }
    return WriteSnapshot(ledger.ExportState(), tokenStates);
}

Status LedgerDB::Load(ledger::StakeLedger& ledger,
                      const std::vector<asset::TokenLedger*>& tokens) {
    ledger::LedgerState state;
    Status s = ReadLedgerState(state);
    if (!s.ok()) {
        return s;
    }
    if (!StakesMatchTotal(state)) {
        LOG_ERROR(util::LogCategory::DB) << "Stored totalStaked " << state.totalStaked
                                         << " does not match account stakes";
        return Status::Corruption("totalStaked does not match account stakes");
    }

    std::vector<asset::TokenState> tokenStates(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        s = ReadTokenState(tokens[i]->GetSymbol(), tokenStates[i]);
        if (s.IsNotFound()) {
            // Token never written: keep it as constructed
            tokenStates[i] = tokens[i]->ExportState();
            continue;
        }
        if (!s.ok()) {
            return s;
        }
        if (!BalancesMatchSupply(tokenStates[i])) {
            return Status::Corruption("token " + tokenStates[i].symbol +
                                      ": balances do not match supply");
        }
    }

    if (!ledger.ImportState(state)) {
        return Status::Corruption("ledger state rejected");
    }
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!tokens[i]->ImportState(tokenStates[i])) {
            return Status::Corruption("token " + tokenStates[i].symbol + " state rejected");
        }
    }
    return Status::Ok();
}

} // namespace db
} // namespace stakeledger
