// TIERSTAKE - Reward Tiers Implementation
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include "tierstake/staking/tier.h"
#include "tierstake/util/time.h"

#include <iomanip>
#include <sstream>

namespace tierstake {
namespace staking {

std::string Tier::ToString() const {
    std::ostringstream oss;
    oss << "Tier(rate=" << FormatRateBps(rewardRateBps)
        << ", lock=" << util::FormatDuration(lockDuration) << ")";
    return oss.str();
}

// ============================================================================
// TierRegistry
// ============================================================================

void TierRegistry::SeedDefaults() {
    tiers_[DEFAULT_TIER_BRONZE] = Tier{BRONZE_RATE_BPS, BRONZE_LOCK_DURATION};
    tiers_[DEFAULT_TIER_SILVER] = Tier{SILVER_RATE_BPS, SILVER_LOCK_DURATION};
    tiers_[DEFAULT_TIER_GOLD] = Tier{GOLD_RATE_BPS, GOLD_LOCK_DURATION};
}

StakeResult TierRegistry::SetTier(TierId id, uint32_t rateBps, Duration lockDuration) {
    if (id == INVALID_TIER_ID) {
        return StakeResult::Failure(StakeError::InvalidTier, "tier id 0 is reserved");
    }
    if (lockDuration < 0) {
        return StakeResult::Failure(StakeError::InvalidTier,
                                    "lock duration must not be negative");
    }
    tiers_[id] = Tier{rateBps, lockDuration};
    return StakeResult::Success();
}

Tier TierRegistry::GetTier(TierId id) const {
    auto it = tiers_.find(id);
    if (it == tiers_.end()) {
        return Tier{};
    }
    return it->second;
}

// ============================================================================
// Reward Calculation
// ============================================================================

Amount CalculateReward(Amount amount, uint32_t rateBps) {
    return amount * static_cast<Amount>(rateBps) / BPS_DENOMINATOR;
}

std::string FormatRateBps(uint32_t rateBps) {
    std::ostringstream oss;
    oss << (rateBps / 100) << "." << std::setfill('0') << std::setw(2)
        << (rateBps % 100) << "%";
    return oss.str();
}

} // namespace staking
} // namespace tierstake
