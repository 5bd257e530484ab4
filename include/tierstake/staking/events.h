// TIERSTAKE - Staking Events
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Notifications emitted by the engine after a mutation commits, in commit
// order. Failed operations emit nothing.

#ifndef TIERSTAKE_STAKING_EVENTS_H
#define TIERSTAKE_STAKING_EVENTS_H

#include <tierstake/core/types.h>

#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace tierstake {
namespace staking {

// ============================================================================
// Event Types
// ============================================================================

struct TierUpdatedEvent {
    TierId tierId{0};
    uint32_t rewardRateBps{0};
    Duration lockDuration{0};

    std::string ToString() const;
};

struct WhitelistChangedEvent {
    Address principal;
    bool approved{false};

    std::string ToString() const;
};

struct DepositedEvent {
    Address principal;
    TierId tierId{0};
    Amount amount{0};
    Amount reward{0};
    Timestamp unlockTimestamp{0};

    std::string ToString() const;
};

struct ClaimedEvent {
    Address principal;
    TierId tierId{0};
    Amount payout{0};

    std::string ToString() const;
};

using StakingEvent = std::variant<TierUpdatedEvent, WhitelistChangedEvent,
                                  DepositedEvent, ClaimedEvent>;

/// Render any event
std::string EventToString(const StakingEvent& event);

// ============================================================================
// Listener Interface
// ============================================================================

/**
 * Observer of committed engine mutations. Callbacks run while the engine
 * holds its lock and must not call back into the engine. A std::exception
 * thrown by a callback is logged and dropped; the mutation stays committed
 * and the remaining listeners are still notified.
 */
class IStakingListener {
public:
    virtual ~IStakingListener() = default;

    virtual void OnTierUpdated(const TierUpdatedEvent& /*event*/) {}
    virtual void OnWhitelistChanged(const WhitelistChangedEvent& /*event*/) {}
    virtual void OnDeposited(const DepositedEvent& /*event*/) {}
    virtual void OnClaimed(const ClaimedEvent& /*event*/) {}
};

// ============================================================================
// Event Recorder
// ============================================================================

/// Listener that keeps an ordered audit trail
class EventRecorder : public IStakingListener {
public:
    void OnTierUpdated(const TierUpdatedEvent& event) override { Append(event); }
    void OnWhitelistChanged(const WhitelistChangedEvent& event) override { Append(event); }
    void OnDeposited(const DepositedEvent& event) override { Append(event); }
    void OnClaimed(const ClaimedEvent& event) override { Append(event); }

    std::vector<StakingEvent> Entries() const;

    size_t Size() const;

    void Clear();

private:
    void Append(StakingEvent event);

    mutable std::mutex mutex_;
    std::vector<StakingEvent> entries_;
};

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_EVENTS_H
