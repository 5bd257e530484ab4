// TIERSTAKE - Staking Engine Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/engine.h"
#include "tierstake/util/logging.h"
#include "tierstake/util/time.h"

#include <algorithm>
#include <stdexcept>

namespace tierstake {
namespace staking {

namespace {

IAssetTransfer& RequireTransfer(const std::shared_ptr<IAssetTransfer>& transfer) {
    if (!transfer) {
        throw std::invalid_argument("StakingEngine requires an asset transfer");
    }
    return *transfer;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

StakingEngine::StakingEngine(const Address& owner,
                             std::shared_ptr<IAssetTransfer> transfer,
                             const EngineOptions& options)
    : owner_(owner)
    , options_(options)
    , transfer_(std::move(transfer))
    , access_(owner)
    , cooldown_(options.cooldownPeriod)
    , claims_(ledger_, RequireTransfer(transfer_)) {
    tiers_.SeedDefaults();
    LOG_INFO(util::LogCategory::STAKING) << "Staking engine created, owner "
        << owner_.ToHex() << ", cooldown " << util::FormatDuration(options_.cooldownPeriod);
}

StakingEngine::StakingEngine(RestoreTag, const LedgerSnapshot& snapshot,
                             std::shared_ptr<IAssetTransfer> transfer)
    : owner_(snapshot.owner)
    , options_(snapshot.options)
    , transfer_(std::move(transfer))
    , access_(snapshot.owner)
    , cooldown_(snapshot.options.cooldownPeriod)
    , claims_(ledger_, RequireTransfer(transfer_)) {
    tiers_.Restore(snapshot.tiers);
    access_.Restore(snapshot.approved);
    cooldown_.Restore(snapshot.lastDeposit);
    ledger_.Restore(snapshot.records, snapshot.claimed);
    LOG_INFO(util::LogCategory::STAKING) << "Staking engine restored: "
        << tiers_.Size() << " tiers, " << ledger_.Size() << " records";
}

StakingEngine::~StakingEngine() = default;

std::unique_ptr<StakingEngine> StakingEngine::FromSnapshot(
    const LedgerSnapshot& snapshot, std::shared_ptr<IAssetTransfer> transfer) {
    return std::unique_ptr<StakingEngine>(
        new StakingEngine(RestoreTag{}, snapshot, std::move(transfer)));
}

// ============================================================================
// Helpers
// ============================================================================

template<typename Event, typename Handler>
void StakingEngine::Emit(const Event& event, Handler handler) {
    for (const auto& listener : listeners_) {
        try {
            ((*listener).*handler)(event);
        } catch (const std::exception& e) {
            LogWarnF(util::LogCategory::STAKING, "Listener failed on %s: %s",
                     event.ToString().c_str(), e.what());
        }
    }
}

StakeResult StakingEngine::Reject(const char* operation, const Address& caller,
                                  StakeResult result) {
    LOG_DEBUG(util::LogCategory::STAKING) << operation << " by " << caller.ToHex()
        << " rejected: " << result.ToString();
    return result;
}

// ============================================================================
// Administration
// ============================================================================

StakeResult StakingEngine::SetTier(const Address& caller, TierId tierId,
                                   uint32_t rateBps, Duration lockDuration) {
    std::lock_guard<std::mutex> lock(mutex_);

    StakeResult result = access_.RequireOwner(caller);
    if (!result) {
        return Reject("SetTier", caller, result);
    }

    result = tiers_.SetTier(tierId, rateBps, lockDuration);
    if (!result) {
        return Reject("SetTier", caller, result);
    }

    LOG_INFO(util::LogCategory::STAKING) << "Tier " << tierId << " set to "
        << tiers_.GetTier(tierId).ToString();
    Emit(TierUpdatedEvent{tierId, rateBps, lockDuration}, &IStakingListener::OnTierUpdated);
    return result;
}

StakeResult StakingEngine::SetApproval(const Address& caller, const Address& principal,
                                       bool approved) {
    std::lock_guard<std::mutex> lock(mutex_);

    StakeResult result = access_.RequireOwner(caller);
    if (!result) {
        return Reject("SetApproval", caller, result);
    }

    access_.SetApproval(principal, approved);

    LOG_INFO(util::LogCategory::STAKING) << "Whitelist " << principal.ToHex()
        << " = " << (approved ? "approved" : "not approved");
    Emit(WhitelistChangedEvent{principal, approved}, &IStakingListener::OnWhitelistChanged);
    return result;
}

// ============================================================================
// User Operations
// ============================================================================

DepositResult StakingEngine::Deposit(const Address& caller, TierId tierId,
                                     Amount amount, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    DepositResult result;

    result.status = access_.RequireApproved(caller);
    if (!result.IsOk()) {
        result.status = Reject("Deposit", caller, result.status);
        return result;
    }

    result.status = cooldown_.Check(caller, now);
    if (!result.IsOk()) {
        result.status = Reject("Deposit", caller, result.status);
        return result;
    }

    Tier tier = tiers_.GetTier(tierId);
    if (!tier.IsConfigured()) {
        result.status = Reject("Deposit", caller, StakeResult::Failure(
            StakeError::InvalidTier, "tier " + std::to_string(tierId) + " is not configured"));
        return result;
    }

    if (amount == 0) {
        result.status = Reject("Deposit", caller, StakeResult::Failure(
            StakeError::ZeroAmount, "deposit amount must be positive"));
        return result;
    }

    if (!ledger_.NextUnlockTime(caller, tierId, now, tier.lockDuration)) {
        result.status = Reject("Deposit", caller, StakeResult::Failure(
            StakeError::TimestampOverflow,
            "unlock time for a deposit at " + std::to_string(now) + " is out of range"));
        return result;
    }

    Amount reward = CalculateReward(amount, tier);

    // Nothing has been written yet, so a failed transfer needs no undo
    if (!TryTransferIn(*transfer_, caller, options_.custody, amount)) {
        result.status = Reject("Deposit", caller, StakeResult::Failure(
            StakeError::TransferFailed,
            "transfer of " + std::to_string(amount) + " into custody failed"));
        return result;
    }

    StakeRecord record = ledger_.ApplyDeposit(caller, tierId, amount, reward, now,
                                              tier.lockDuration);
    cooldown_.Record(caller, now);

    result.amount = amount;
    result.reward = reward;
    result.stakedAmount = record.stakedAmount;
    result.accruedReward = record.accruedReward;
    result.unlockTimestamp = record.unlockTimestamp;

    LOG_INFO(util::LogCategory::STAKING) << caller.ToHex() << " deposited " << amount
        << " in tier " << tierId << ", reward " << reward
        << ", unlock " << record.unlockTimestamp;
    Emit(DepositedEvent{caller, tierId, amount, reward, record.unlockTimestamp},
         &IStakingListener::OnDeposited);
    return result;
}

ClaimResult StakingEngine::Claim(const Address& caller, TierId tierId, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClaimResult result;

    result.status = access_.RequireApproved(caller);
    if (!result.IsOk()) {
        result.status = Reject("Claim", caller, result.status);
        return result;
    }

    result = claims_.Process(caller, tierId, now);
    if (!result.IsOk()) {
        result.status = Reject("Claim", caller, result.status);
        return result;
    }

    LOG_INFO(util::LogCategory::STAKING) << caller.ToHex() << " claimed " << result.payout
        << " from tier " << tierId;
    Emit(ClaimedEvent{caller, tierId, result.payout}, &IStakingListener::OnClaimed);
    return result;
}

// ============================================================================
// Queries
// ============================================================================

StakeRecord StakingEngine::GetStakeDetails(const Address& principal, TierId tierId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.GetRecord(principal, tierId);
}

Tier StakingEngine::GetTier(TierId tierId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiers_.GetTier(tierId);
}

bool StakingEngine::IsApproved(const Address& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return access_.IsApproved(principal);
}

bool StakingEngine::HasClaimed(const Address& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.HasClaimed(principal);
}

std::optional<Timestamp> StakingEngine::GetLastDepositTime(const Address& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cooldown_.GetLastDepositTime(principal);
}

Address StakingEngine::GetOwner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_;
}

Amount StakingEngine::GetTotalStaked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.GetTotalStaked();
}

EngineOptions StakingEngine::GetOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

// ============================================================================
// Listeners
// ============================================================================

void StakingEngine::AddListener(std::shared_ptr<IStakingListener> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listener) {
        listeners_.push_back(std::move(listener));
    }
}

void StakingEngine::RemoveListener(const std::shared_ptr<IStakingListener>& listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

// ============================================================================
// Persistence
// ============================================================================

LedgerSnapshot StakingEngine::ExportState() const {
    std::lock_guard<std::mutex> lock(mutex_);

    LedgerSnapshot snapshot;
    snapshot.owner = owner_;
    snapshot.options = options_;
    snapshot.tiers = tiers_.GetAll();
    snapshot.approved = access_.GetApproved();
    snapshot.lastDeposit = cooldown_.GetAll();
    snapshot.records = ledger_.GetRecords();
    snapshot.claimed = ledger_.GetClaimed();
    return snapshot;
}

} // namespace staking
} // namespace tierstake
