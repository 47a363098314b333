// StakeLedger - Reserve Manager Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/ledger/reserve.h>

namespace stakeledger {
namespace ledger {

ReserveManager::ReserveManager(const Address& administrator)
    : administrator_(administrator) {}

bool ReserveManager::Credit(const Amount& amount) {
    Amount reserve;
    Amount deposited;
    if (!CheckedAdd(reserve_, amount, reserve) ||
        !CheckedAdd(totalDeposited_, amount, deposited)) {
        return false;
    }
    reserve_ = reserve;
    totalDeposited_ = deposited;
    return true;
}

bool ReserveManager::Debit(const Amount& amount) {
    Amount reserve;
    Amount paid;
    if (!CheckedSub(reserve_, amount, reserve) ||
        !CheckedAdd(totalPaidOut_, amount, paid)) {
        return false;
    }
    reserve_ = reserve;
    totalPaidOut_ = paid;
    return true;
}

void ReserveManager::Restore(const Amount& reserve, const Amount& totalDeposited,
                             const Amount& totalPaidOut) {
    reserve_ = reserve;
    totalDeposited_ = totalDeposited;
    totalPaidOut_ = totalPaidOut;
}

} // namespace ledger
} // namespace stakeledger
