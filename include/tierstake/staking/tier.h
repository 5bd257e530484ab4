// TIERSTAKE - Reward Tiers
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// Tier registry (reward rate and lock duration per tier id) and the
// reward calculation applied at deposit time.

#ifndef TIERSTAKE_STAKING_TIER_H
#define TIERSTAKE_STAKING_TIER_H

#include <tierstake/core/types.h>
#include <tierstake/staking/errors.h>

#include <cstdint>
#include <map>
#include <string>

namespace tierstake {
namespace staking {

// ============================================================================
// Tier Constants
// ============================================================================

/// Basis point denominator (10000 = 100%)
constexpr uint64_t BPS_DENOMINATOR = 10000;

/// Tier id 0 is reserved
constexpr TierId INVALID_TIER_ID = 0;

/// Default tiers seeded at engine creation
constexpr TierId DEFAULT_TIER_BRONZE = 1;
constexpr TierId DEFAULT_TIER_SILVER = 2;
constexpr TierId DEFAULT_TIER_GOLD = 3;

/// 5% / 7 days
constexpr uint32_t BRONZE_RATE_BPS = 500;
constexpr Duration BRONZE_LOCK_DURATION = 7 * SECONDS_PER_DAY;

/// 10% / 14 days
constexpr uint32_t SILVER_RATE_BPS = 1000;
constexpr Duration SILVER_LOCK_DURATION = 14 * SECONDS_PER_DAY;

/// 15% / 30 days
constexpr uint32_t GOLD_RATE_BPS = 1500;
constexpr Duration GOLD_LOCK_DURATION = 30 * SECONDS_PER_DAY;

// ============================================================================
// Tier
// ============================================================================

struct Tier {
    /// Reward rate in basis points
    uint32_t rewardRateBps{0};

    /// Seconds a deposit stays locked
    Duration lockDuration{0};

    /// A tier with no positive lock duration counts as not configured
    bool IsConfigured() const { return lockDuration > 0; }

    bool operator==(const Tier& other) const {
        return rewardRateBps == other.rewardRateBps &&
               lockDuration == other.lockDuration;
    }
    bool operator!=(const Tier& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// Tier Registry
// ============================================================================

/**
 * Per-tier reward parameters. Tiers are created or overwritten, never
 * removed. Not internally synchronised; the engine serialises access.
 */
class TierRegistry {
public:
    using TierMap = std::map<TierId, Tier>;

    TierRegistry() = default;

    /// Install tiers 1-3 with their default parameters
    void SeedDefaults();

    /// Overwrite a tier. Fails with InvalidTier for id 0 or a negative lock.
    StakeResult SetTier(TierId id, uint32_t rateBps, Duration lockDuration);

    /// Tier parameters, or a zero tier if never set
    Tier GetTier(TierId id) const;

    bool HasTier(TierId id) const { return tiers_.count(id) > 0; }

    size_t Size() const { return tiers_.size(); }

    const TierMap& GetAll() const { return tiers_; }

    /// Replace all tiers (snapshot restore)
    void Restore(const TierMap& tiers) { tiers_ = tiers; }

private:
    TierMap tiers_;
};

// ============================================================================
// Reward Calculation
// ============================================================================

/**
 * Reward owed for a deposit: amount * rateBps / 10000, floor division.
 * The product is computed in the native Amount width, so amounts above
 * MAX_AMOUNT / rateBps wrap modulo 2^64.
 */
Amount CalculateReward(Amount amount, uint32_t rateBps);

inline Amount CalculateReward(Amount amount, const Tier& tier) {
    return CalculateReward(amount, tier.rewardRateBps);
}

/// Format basis points as a percentage, e.g. 1250 -> "12.50%"
std::string FormatRateBps(uint32_t rateBps);

} // namespace staking
} // namespace tierstake

#endif // TIERSTAKE_STAKING_TIER_H
