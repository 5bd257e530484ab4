// TIERSTAKE - Tier Registry and Reward Tests
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License

#include <gtest/gtest.h>

#include "tierstake/staking/tier.h"

namespace tierstake {
namespace staking {
namespace test {

// ============================================================================
// Tier Registry
// ============================================================================

class TierRegistryTest : public ::testing::Test {
protected:
    TierRegistry registry_;
};

TEST_F(TierRegistryTest, UnknownTierIsZeroAndUnconfigured) {
    Tier tier = registry_.GetTier(42);
    EXPECT_EQ(tier.rewardRateBps, 0u);
    EXPECT_EQ(tier.lockDuration, 0);
    EXPECT_FALSE(tier.IsConfigured());
    EXPECT_FALSE(registry_.HasTier(42));
}

TEST_F(TierRegistryTest, SeedDefaults) {
    registry_.SeedDefaults();
    EXPECT_EQ(registry_.Size(), 3u);

    EXPECT_EQ(registry_.GetTier(1), (Tier{500, 7 * SECONDS_PER_DAY}));
    EXPECT_EQ(registry_.GetTier(2), (Tier{1000, 14 * SECONDS_PER_DAY}));
    EXPECT_EQ(registry_.GetTier(3), (Tier{1500, 30 * SECONDS_PER_DAY}));
    EXPECT_FALSE(registry_.GetTier(4).IsConfigured());
}

TEST_F(TierRegistryTest, SetTierLastWriterWins) {
    ASSERT_TRUE(registry_.SetTier(7, 250, 3600).IsOk());
    ASSERT_TRUE(registry_.SetTier(7, 900, 7200).IsOk());

    EXPECT_EQ(registry_.GetTier(7), (Tier{900, 7200}));
    EXPECT_EQ(registry_.Size(), 1u);
}

TEST_F(TierRegistryTest, SetTierZeroIsInvalid) {
    StakeResult result = registry_.SetTier(0, 500, 3600);
    EXPECT_FALSE(result.IsOk());
    EXPECT_EQ(result.error, StakeError::InvalidTier);
    EXPECT_FALSE(registry_.HasTier(0));
}

TEST_F(TierRegistryTest, NegativeLockIsInvalid) {
    ASSERT_TRUE(registry_.SetTier(7, 500, 3600).IsOk());

    StakeResult result = registry_.SetTier(7, 500, -100);
    EXPECT_EQ(result.error, StakeError::InvalidTier);
    EXPECT_EQ(registry_.GetTier(7), (Tier{500, 3600}));

    EXPECT_EQ(registry_.SetTier(8, 500, -1).error, StakeError::InvalidTier);
    EXPECT_FALSE(registry_.HasTier(8));
}

TEST_F(TierRegistryTest, RestoredNegativeLockIsUnconfigured) {
    registry_.Restore({{9, Tier{500, -100}}});
    EXPECT_FALSE(registry_.GetTier(9).IsConfigured());
}

TEST_F(TierRegistryTest, ZeroLockTierIsStoredButUnconfigured) {
    ASSERT_TRUE(registry_.SetTier(5, 500, 0).IsOk());
    EXPECT_TRUE(registry_.HasTier(5));
    EXPECT_FALSE(registry_.GetTier(5).IsConfigured());
}

TEST_F(TierRegistryTest, TierToString) {
    std::string str = Tier{1250, 7 * SECONDS_PER_DAY}.ToString();
    EXPECT_NE(str.find("12.50%"), std::string::npos);
    EXPECT_NE(str.find("7d"), std::string::npos);
}

// ============================================================================
// Reward Calculation
// ============================================================================

TEST(RewardTest, BasisPoints) {
    EXPECT_EQ(CalculateReward(1000, 500), 50u);
    EXPECT_EQ(CalculateReward(1000, 1500), 150u);
    EXPECT_EQ(CalculateReward(1000, 10000), 1000u);
    EXPECT_EQ(CalculateReward(1000, 0), 0u);
}

TEST(RewardTest, FloorDivision) {
    EXPECT_EQ(CalculateReward(3, 1), 0u);
    EXPECT_EQ(CalculateReward(19999, 1), 1u);
    EXPECT_EQ(CalculateReward(199, 500), 9u);
}

TEST(RewardTest, Deterministic) {
    Tier tier{1000, 14 * SECONDS_PER_DAY};
    EXPECT_EQ(CalculateReward(123456789, tier), CalculateReward(123456789, tier));
    EXPECT_EQ(CalculateReward(123456789, tier), 12345678u);
}

TEST(RewardTest, LargestExactAmount) {
    // Largest amount whose product with 1500 bps still fits in 64 bits
    const Amount limit = MAX_AMOUNT / 1500;
    EXPECT_EQ(CalculateReward(limit, 1500), limit * 1500 / BPS_DENOMINATOR);
    EXPECT_EQ(CalculateReward(limit, 1500), limit / 10000 * 1500 + (limit % 10000) * 1500 / 10000);
}

TEST(RewardTest, ProductWrapsBeyondNativeWidth) {
    // One unit past the limit the product wraps modulo 2^64
    const Amount amount = MAX_AMOUNT / 1500 + 1;
    const Amount wrapped = amount * 1500;
    EXPECT_LT(wrapped, amount);
    EXPECT_EQ(CalculateReward(amount, 1500), wrapped / BPS_DENOMINATOR);
}

TEST(RewardTest, FormatRateBps) {
    EXPECT_EQ(FormatRateBps(500), "5.00%");
    EXPECT_EQ(FormatRateBps(1), "0.01%");
    EXPECT_EQ(FormatRateBps(10000), "100.00%");
}

} // namespace test
} // namespace staking
} // namespace tierstake
