// TIERSTAKE - Staking Events Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/events.h"

#include <sstream>

namespace tierstake {
namespace staking {

std::string TierUpdatedEvent::ToString() const {
    std::ostringstream oss;
    oss << "TierUpdated tier=" << tierId
        << " rate=" << rewardRateBps
        << " lock=" << lockDuration;
    return oss.str();
}

std::string WhitelistChangedEvent::ToString() const {
    std::ostringstream oss;
    oss << "WhitelistChanged principal=" << principal.ToHex()
        << " approved=" << (approved ? 1 : 0);
    return oss.str();
}

std::string DepositedEvent::ToString() const {
    std::ostringstream oss;
    oss << "Deposited principal=" << principal.ToHex()
        << " tier=" << tierId
        << " amount=" << amount
        << " reward=" << reward
        << " unlock=" << unlockTimestamp;
    return oss.str();
}

std::string ClaimedEvent::ToString() const {
    std::ostringstream oss;
    oss << "Claimed principal=" << principal.ToHex()
        << " tier=" << tierId
        << " payout=" << payout;
    return oss.str();
}

std::string EventToString(const StakingEvent& event) {
    return std::visit([](const auto& e) { return e.ToString(); }, event);
}

// ============================================================================
// EventRecorder
// ============================================================================

void EventRecorder::Append(StakingEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(event));
}

std::vector<StakingEvent> EventRecorder::Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t EventRecorder::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void EventRecorder::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace staking
} // namespace tierstake
