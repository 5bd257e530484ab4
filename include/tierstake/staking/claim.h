// TIERSTAKE - Claim Processing
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#ifndef TIERSTAKE_STAKING_CLAIM_H
#define TIERSTAKE_STAKING_CLAIM_H

#include <tierstake/core/types.h>
#include <tierstake/staking/errors.h>

namespace tierstake {
namespace staking {

class IAssetTransfer;
class StakeLedger;

/**
 * Settles a claim against the ledger and pays it out. If the payout
 * transfer fails the ledger is rolled back to its state before the claim,
 * so a failed claim leaves no trace.
 */
class ClaimProcessor {
public:
    ClaimProcessor(StakeLedger& ledger, IAssetTransfer& transfer)
        : ledger_(ledger), transfer_(transfer) {}

    ClaimResult Process(const Address& principal, TierId tierId, Timestamp now);

private:
    StakeLedger& ledger_;
    IAssetTransfer& transfer_;
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_CLAIM_H
