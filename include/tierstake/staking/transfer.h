// TIERSTAKE - Asset Transfer
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// The engine never keeps token balances itself. It moves the staked asset
// through an injected IAssetTransfer, which may fail.

#ifndef TIERSTAKE_STAKING_TRANSFER_H
#define TIERSTAKE_STAKING_TRANSFER_H

#include <tierstake/core/types.h>

#include <map>
#include <mutex>

namespace tierstake {
namespace staking {

// ============================================================================
// Transfer Interface
// ============================================================================

class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    /// Move `amount` from `from` to `to`. Returns false on failure.
    virtual bool TransferIn(const Address& from, const Address& to, Amount amount) = 0;

    /// Pay `amount` out of custody to `to`. Returns false on failure.
    virtual bool TransferOut(const Address& to, Amount amount) = 0;
};

/// Call TransferIn; a thrown std::exception is logged and reported as failure
bool TryTransferIn(IAssetTransfer& transfer, const Address& from,
                   const Address& to, Amount amount);

/// Call TransferOut; a thrown std::exception is logged and reported as failure
bool TryTransferOut(IAssetTransfer& transfer, const Address& to, Amount amount);

// ============================================================================
// In-Memory Asset Ledger
// ============================================================================

/**
 * Balance book for a single asset. TransferOut pays from the custody
 * account. Credit stands in for the external minting collaborator.
 */
class InMemoryAssetLedger : public IAssetTransfer {
public:
    using BalanceMap = std::map<Address, Amount>;

    explicit InMemoryAssetLedger(const Address& custody);

    bool TransferIn(const Address& from, const Address& to, Amount amount) override;
    bool TransferOut(const Address& to, Amount amount) override;

    /// Add funds to an account. Returns false if the balance would overflow.
    bool Credit(const Address& account, Amount amount);

    Amount BalanceOf(const Address& account) const;

    const Address& GetCustody() const { return custody_; }

    BalanceMap GetBalances() const;

    void Restore(const BalanceMap& balances);

private:
    bool Move(const Address& from, const Address& to, Amount amount);

    mutable std::mutex mutex_;
    Address custody_;
    BalanceMap balances_;
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_TRANSFER_H
