// TIERSTAKE - Staking Engine
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Public entry point of the tiered staking ledger.
//
// Every public call runs under one engine mutex, so mutations never
// interleave and reads always see a consistent state. Time is never read
// from the clock; callers pass `now`.

#ifndef TIERSTAKE_STAKING_ENGINE_H
#define TIERSTAKE_STAKING_ENGINE_H

#include <tierstake/core/types.h>
#include <tierstake/staking/access.h>
#include <tierstake/staking/claim.h>
#include <tierstake/staking/cooldown.h>
#include <tierstake/staking/errors.h>
#include <tierstake/staking/events.h>
#include <tierstake/staking/ledger.h>
#include <tierstake/staking/options.h>
#include <tierstake/staking/tier.h>
#include <tierstake/staking/transfer.h>

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace tierstake {
namespace staking {

// ============================================================================
// Ledger Snapshot
// ============================================================================

/// Complete engine state, for persistence
struct LedgerSnapshot {
    Address owner;
    EngineOptions options;
    TierRegistry::TierMap tiers;
    std::set<Address> approved;
    CooldownGuard::DepositTimes lastDeposit;
    StakeLedger::RecordMap records;
    std::set<Address> claimed;
};

// ============================================================================
// Staking Engine
// ============================================================================

class StakingEngine {
public:
    /// Create an engine owned by `owner` and seed tiers 1-3
    StakingEngine(const Address& owner,
                  std::shared_ptr<IAssetTransfer> transfer,
                  const EngineOptions& options = EngineOptions());

    ~StakingEngine();

    StakingEngine(const StakingEngine&) = delete;
    StakingEngine& operator=(const StakingEngine&) = delete;

    /// Rebuild an engine from saved state. Tiers are not re-seeded.
    static std::unique_ptr<StakingEngine> FromSnapshot(const LedgerSnapshot& snapshot,
                                                       std::shared_ptr<IAssetTransfer> transfer);

    // === Administration (owner only) ===

    /// Create or overwrite a tier. NotOwner, InvalidTier (id 0 or negative lock).
    StakeResult SetTier(const Address& caller, TierId tierId,
                        uint32_t rateBps, Duration lockDuration);

    /// Whitelist or remove a principal. NotOwner.
    StakeResult SetApproval(const Address& caller, const Address& principal, bool approved);

    // === User Operations (whitelisted) ===

    /**
     * Stake `amount` in a tier. Checks in order: NotApproved, CooldownActive,
     * InvalidTier, ZeroAmount. Funds move to custody before any local state
     * changes; a failed transfer returns TransferFailed with no effect.
     */
    DepositResult Deposit(const Address& caller, TierId tierId, Amount amount, Timestamp now);

    /**
     * Withdraw stake plus reward. Checks in order: NotApproved, NoActiveStake,
     * StakeAlreadyClaimed, StakeStillLocked. A failed payout is rolled back.
     */
    ClaimResult Claim(const Address& caller, TierId tierId, Timestamp now);

    // === Queries ===

    StakeRecord GetStakeDetails(const Address& principal, TierId tierId) const;

    Tier GetTier(TierId tierId) const;

    bool IsApproved(const Address& principal) const;

    bool HasClaimed(const Address& principal) const;

    std::optional<Timestamp> GetLastDepositTime(const Address& principal) const;

    Address GetOwner() const;

    Amount GetTotalStaked() const;

    EngineOptions GetOptions() const;

    // === Listeners ===

    void AddListener(std::shared_ptr<IStakingListener> listener);
    void RemoveListener(const std::shared_ptr<IStakingListener>& listener);

    // === Persistence ===

    LedgerSnapshot ExportState() const;

private:
    struct RestoreTag {};
    StakingEngine(RestoreTag, const LedgerSnapshot& snapshot,
                  std::shared_ptr<IAssetTransfer> transfer);

    template<typename Event, typename Handler>
    void Emit(const Event& event, Handler handler);

    static StakeResult Reject(const char* operation, const Address& caller,
                              StakeResult result);

    mutable std::mutex mutex_;

    Address owner_;
    EngineOptions options_;
    std::shared_ptr<IAssetTransfer> transfer_;

    TierRegistry tiers_;
    AccessControl access_;
    CooldownGuard cooldown_;
    StakeLedger ledger_;
    ClaimProcessor claims_;

    std::vector<std::shared_ptr<IStakingListener>> listeners_;
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_ENGINE_H
