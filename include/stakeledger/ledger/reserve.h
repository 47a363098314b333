// StakeLedger - Reserve Manager
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#ifndef STAKELEDGER_LEDGER_RESERVE_H
#define STAKELEDGER_LEDGER_RESERVE_H

#include <stakeledger/core/types.h>

namespace stakeledger {
namespace ledger {

/**
 * Base-asset balance backing unlock payouts.
 *
 * Increased only by administrator deposits, decreased only by unlock
 * payouts. Not synchronized: the owning StakeLedger serializes access and
 * works on copies until an operation commits.
 */
class ReserveManager {
public:
    explicit ReserveManager(const Address& administrator);

    const Address& GetAdministrator() const { return administrator_; }
    bool IsAdministrator(const Address& caller) const { return caller == administrator_; }

    const Amount& GetReserve() const { return reserve_; }

    /// Lifetime totals
    const Amount& GetTotalDeposited() const { return totalDeposited_; }
    const Amount& GetTotalPaidOut() const { return totalPaidOut_; }

    bool CanCover(const Amount& payout) const { return payout <= reserve_; }

    /// Add a deposit; false (and unchanged) on overflow
    bool Credit(const Amount& amount);

    /// Remove a payout; false (and unchanged) if it exceeds the reserve
    bool Debit(const Amount& amount);

    /// Restore persisted values
    void Restore(const Amount& reserve, const Amount& totalDeposited,
                 const Amount& totalPaidOut);

private:
    Address administrator_;
    Amount reserve_;
    Amount totalDeposited_;
    Amount totalPaidOut_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_RESERVE_H
